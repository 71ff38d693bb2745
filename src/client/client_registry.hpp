#ifndef REQKEEP_CLIENT_CLIENT_REGISTRY_HPP
#define REQKEEP_CLIENT_CLIENT_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "client/client_entry.hpp"
#include "request/request_identity.hpp"
#include "request/request_record.hpp"

namespace reqkeep::client
{
    /**
     * @brief Client entries of one persistent tier. The registry of the
     * CRASH_PERSISTENT tier is the persistent root that gets checkpointed.
     */
    class ClientRegistry
    {
    public:
        using RecordPtr = request::RequestRecord::Ptr;

        ClientRegistry( request::DurabilityTier tier, ClientLimits limits );

        /**
         * @brief Finds the entry for a client or the shared queue, creating it
         * if needed
         * @param name - must be absent exactly when shared is true
         * @return entry or INVALID_IDENTITY
         */
        outcome::result<std::shared_ptr<ClientEntry>> lookupOrCreateClient( bool                                shared,
                                                                            const boost::optional<std::string> &name );

        /**
         * @return entry or nullptr if there is none
         */
        std::shared_ptr<ClientEntry> getClient( bool shared, const boost::optional<std::string> &name ) const;

        std::vector<std::shared_ptr<ClientEntry>> clients() const;

        std::vector<RecordPtr> allRequests() const;

        /**
         * @return the request or nullptr
         */
        RecordPtr find( const request::RequestIdentity &identity ) const;

        /**
         * @brief Adds a resumed request to the entry of its client
         */
        outcome::result<void> resume( const RecordPtr &record );

        request::DurabilityTier tier() const
        {
            return tier_;
        }

    private:
        const request::DurabilityTier tier_;
        const ClientLimits            limits_;

        mutable std::mutex                                  mutex_;
        std::shared_ptr<ClientEntry>                        shared_queue_;
        std::map<std::string, std::shared_ptr<ClientEntry>> clients_;
    };
}

#endif // REQKEEP_CLIENT_CLIENT_REGISTRY_HPP
