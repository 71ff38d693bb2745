#ifndef REQKEEP_PERSISTENCE_REQUEST_STORE_HPP
#define REQKEEP_PERSISTENCE_REQUEST_STORE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <set>

#include "base/buffer.hpp"
#include "base/logger.hpp"
#include "client/client_registry.hpp"
#include "jobs/checkpointer.hpp"
#include "request/request_context.hpp"
#include "request/request_record.hpp"
#include "storage/buffer_map_types.hpp"

namespace reqkeep::persistence
{
    struct ResumeReport
    {
        size_t resumed = 0;
        size_t failed  = 0;
    };

    /**
     * @brief Durable form of the CRASH_PERSISTENT requests. Each record is
     * stored under a key derived from its identity, as the serialized record
     * followed by a CRC-32.
     */
    class RequestStore : public jobs::Checkpointer
    {
    public:
        using RecordPtr = request::RequestRecord::Ptr;
        using Visitor   = std::function<void( const base::Buffer &key, const outcome::result<RecordPtr> &record )>;

        /**
         * @param persistent_root - registry whose requests are checkpointed
         */
        RequestStore( std::shared_ptr<storage::BufferStorage> storage,
                      std::shared_ptr<client::ClientRegistry> persistent_root );

        ~RequestStore() override = default;

        /**
         * @brief Writes every live request of the persistent root in one batch
         * and deletes the records of requests that are gone
         */
        outcome::result<void> checkpoint( bool final ) override;

        /**
         * @brief Loads the stored requests and resumes them. A record that
         * cannot be read or resumed is logged, left in storage and skipped.
         */
        ResumeReport resumeAll( request::RequestContext &ctx );

        static base::Buffer keyPrefix();

        static outcome::result<base::Buffer> recordKey( const request::RequestIdentity &identity );

        static outcome::result<request::RequestIdentity> identityFromKey( const base::Buffer &key );

        static outcome::result<base::Buffer> encodeRecord( const request::RequestRecord &record );

        static outcome::result<RecordPtr> decodeRecord( const base::Buffer                        &key,
                                                        const base::Buffer                        &value,
                                                        const std::shared_ptr<clock::SystemClock> &clock );

        /**
         * @brief Decodes every stored record, without resuming it
         * @return storage error from iterating
         */
        static outcome::result<void> forEachStored( storage::BufferStorage                    &storage,
                                                    const std::shared_ptr<clock::SystemClock> &clock,
                                                    const Visitor                             &visitor );

    private:
        const std::shared_ptr<storage::BufferStorage> storage_;
        const std::shared_ptr<client::ClientRegistry> persistent_root_;

        std::mutex             mutex_;
        std::set<base::Buffer> stored_keys_;

        base::Logger logger_ = base::createLogger( "RequestStore" );
    };
}

#endif // REQKEEP_PERSISTENCE_REQUEST_STORE_HPP
