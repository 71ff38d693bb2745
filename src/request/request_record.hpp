#ifndef REQKEEP_REQUEST_REQUEST_RECORD_HPP
#define REQKEEP_REQUEST_REQUEST_RECORD_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <boost/optional.hpp>

#include "base/logger.hpp"
#include "clock/clock.hpp"
#include "codec/byte_stream.hpp"
#include "outcome/outcome.hpp"
#include "request/durability_tier.hpp"
#include "request/engine.hpp"
#include "request/priority_class.hpp"
#include "request/request_context.hpp"
#include "request/request_identity.hpp"
#include "request/request_owner.hpp"
#include "request/request_tag.hpp"
#include "request/request_variant.hpp"

namespace reqkeep::client
{
    class ClientEntry;
    class ConnectionSession;
}

namespace reqkeep::request
{
    /**
     * Parameters of a new fetch or insert command
     */
    struct RequestParams
    {
        RequestIdentity              identity;
        std::string                  target;
        DurabilityTier               tier           = DurabilityTier::CONNECTION_SCOPED;
        PriorityClass                priority_class = priority::kBulkSplitfile;
        int32_t                      verbosity      = 0;
        bool                         realtime       = false;
        boost::optional<std::string> client_token;
    };

    /**
     * @brief One outstanding fetch or insert. Tracks the lifecycle state of
     * the request, binds it to its engine handle and owner, and writes and
     * reads its durable form.
     *
     * All mutable state is guarded by the record mutex. Owners are called
     * outside of it, the status cache inside of it.
     */
    class RequestRecord final : public RequestCallback, public std::enable_shared_from_this<RequestRecord>
    {
    public:
        using Ptr = std::shared_ptr<RequestRecord>;

        /**
         * @brief Creates a CONNECTION_SCOPED request owned by a session
         */
        static outcome::result<Ptr> createForSession( RequestContext                                   &ctx,
                                                      RequestParams                                     params,
                                                      const std::shared_ptr<client::ConnectionSession> &session,
                                                      std::unique_ptr<RequestVariant>                   variant );

        /**
         * @brief Creates a REBOOT_PERSISTENT or CRASH_PERSISTENT request owned
         * by a client entry of the same tier
         */
        static outcome::result<Ptr> createForClient( RequestContext                             &ctx,
                                                     RequestParams                               params,
                                                     const std::shared_ptr<client::ClientEntry> &client,
                                                     std::unique_ptr<RequestVariant>             variant );

        /**
         * @brief Reads a CRASH_PERSISTENT request written by serialize(). The
         * record is not bound to a client or engine until onResume().
         * @param expected_identity - identity the record is stored under
         */
        static outcome::result<Ptr> restore( codec::ByteReader                         &reader,
                                             const RequestIdentity                     &expected_identity,
                                             const std::shared_ptr<clock::SystemClock> &clock );

        ~RequestRecord() override = default;

        /**
         * @brief Starts the request if it has not been started
         * @return REQUEST_CANCELLED for a cancelled record or the engine error
         */
        outcome::result<void> start( RequestContext &ctx );

        /**
         * @brief Cancels the request and releases its buffers. Only the first
         * call reaches the engine and the owner.
         */
        void cancel( RequestContext &ctx );

        /**
         * @param new_token - token to set, none for no change
         * @param new_priority - priority class to set, none for no change
         * @return true if anything changed, INVALID_PRIORITY if out of range
         */
        outcome::result<bool> modify( const boost::optional<std::string>   &new_token,
                                      const boost::optional<PriorityClass> &new_priority,
                                      RequestContext                       &ctx );

        /**
         * @brief Restarts the request asynchronously. A CRASH_PERSISTENT restart
         * is a durable job, others run on the executor.
         * @return CANNOT_RESTART or PERSISTENCE_DISABLED if the job is refused
         */
        outcome::result<void> restart( RequestContext &ctx, bool disable_filter_data );

        bool canRestart() const;

        /**
         * @brief Evicts a finished request the client never acknowledged
         */
        void dropped( RequestContext &ctx );

        /**
         * @brief Completes a restored request: binds client entry and engine
         * and registers the record with the persistent root
         * @return NOT_PERSISTENT or RESUME_FAILED
         */
        outcome::result<void> onResume( RequestContext &ctx );

        /**
         * @brief Flushes engine state before exit. Errors are logged.
         */
        void onShutdown( RequestContext &ctx );

        /**
         * @brief Writes header, body and variant body
         * @return NOT_PERSISTENT unless the record is CRASH_PERSISTENT
         */
        outcome::result<void> serialize( codec::ByteWriter &writer ) const;

        void onSuccess( RequestContext &ctx ) override;

        void onFailure( const std::string &reason, RequestContext &ctx ) override;

        void onMajorProgress() override;

        /**
         * @brief Releases the payload buckets. Only the first call has an effect.
         */
        void freeData();

        const RequestIdentity &identity() const
        {
            return identity_;
        }

        const std::string &target() const
        {
            return target_;
        }

        DurabilityTier tier() const
        {
            return tier_;
        }

        bool isRealTime() const
        {
            return realtime_;
        }

        int32_t verbosity() const
        {
            return verbosity_;
        }

        int64_t startupTime() const
        {
            return startup_time_;
        }

        RequestKind kind() const
        {
            return identity_.kind();
        }

        PriorityClass                priorityClass() const;
        boost::optional<std::string> clientToken() const;
        bool                         isStarted() const;
        bool                         isFinished() const;
        bool                         hasSucceeded() const;
        bool                         isCancelled() const;
        boost::optional<std::string> failureReason() const;
        int64_t                      completionTime() const;
        int64_t                      lastActivity() const;

        boost::optional<EngineBinding> engineBinding() const;

        RequestProgress progress() const;

        double successFraction() const;

        PersistentRequestTag persistentTag() const;

        /**
         * @return true once the engine knows the final size of the data
         */
        bool isTotalFinalized() const;

        /**
         * @return true once onResume() has bound a restored record to its
         * client and engine. Always false for a record created in this run.
         */
        bool fullyResumed() const;

    private:
        RequestRecord( RequestIdentity                     identity,
                       std::string                         target,
                       DurabilityTier                      tier,
                       bool                                realtime,
                       int32_t                             verbosity,
                       PriorityClass                       priority_class,
                       boost::optional<std::string>        client_token,
                       int64_t                             startup_time,
                       std::unique_ptr<RequestVariant>     variant,
                       std::shared_ptr<clock::SystemClock> clock );

        static outcome::result<Ptr> create( RequestContext                       &ctx,
                                            RequestParams                         params,
                                            const std::shared_ptr<RequestOwner> &owner,
                                            std::unique_ptr<RequestVariant>       variant );

        outcome::result<std::shared_ptr<ClientRequester>> bindRequester( RequestContext &ctx, bool resuming );

        void finish( bool success, boost::optional<std::string> reason, RequestContext &ctx );

        /// Body of a restart, run by the job runner or the executor
        bool runRestart( RequestContext &ctx, bool disable_filter_data );

        /// Header, body and variant body of any tier
        outcome::result<void> encodeBody( codec::ByteWriter &writer ) const;

        std::shared_ptr<RequestOwner> owner() const;

        int64_t now() const;

        const RequestIdentity                     identity_;
        const std::string                         target_;
        const DurabilityTier                      tier_;
        const bool                                realtime_;
        const int32_t                             verbosity_;
        const int64_t                             startup_time_;
        const std::shared_ptr<clock::SystemClock> clock_;

        mutable std::mutex                 mutex_;
        std::mutex                         modify_mutex_;
        std::weak_ptr<RequestOwner>        owner_;
        boost::optional<EngineBinding>     binding_;
        std::shared_ptr<ClientRequester>   requester_;
        std::unique_ptr<RequestVariant>    variant_;
        PriorityClass                      priority_class_;
        boost::optional<std::string>       client_token_;
        bool                               started_   = false;
        bool                               finished_  = false;
        bool                               cancelled_ = false;
        bool                               succeeded_ = false;
        boost::optional<std::string>       failure_reason_;
        int64_t                            completion_time_ = 0;
        int64_t                            last_activity_   = 0;
        std::atomic<bool>                  data_freed_{ false };
        std::atomic<bool>                  resumed_{ false };

        base::Logger logger_ = base::createLogger( "RequestRecord" );
    };
}

#endif // REQKEEP_REQUEST_REQUEST_RECORD_HPP
