#ifndef REQKEEP_CLIENT_CLIENT_ENTRY_HPP
#define REQKEEP_CLIENT_CLIENT_ENTRY_HPP

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "base/logger.hpp"
#include "client/request_event_listener.hpp"
#include "client/request_status_cache.hpp"
#include "request/request_owner.hpp"
#include "request/request_record.hpp"

namespace reqkeep::client
{
    struct ClientLimits
    {
        /// finished requests kept until the client acknowledges them
        size_t max_unacknowledged_finished = 1000;
    };

    /**
     * @brief Requests of one logical client, or of the shared queue, in one
     * durability tier
     */
    class ClientEntry : public request::RequestOwner, public std::enable_shared_from_this<ClientEntry>
    {
    public:
        using RecordPtr = request::RequestRecord::Ptr;

        /**
         * @param name - client name, none for the shared queue
         */
        ClientEntry( bool shared, boost::optional<std::string> name, request::DurabilityTier tier, ClientLimits limits );

        ~ClientEntry() override = default;

        bool isShared() const
        {
            return shared_;
        }

        const boost::optional<std::string> &name() const
        {
            return name_;
        }

        request::DurabilityTier tier() const override
        {
            return tier_;
        }

        request::EngineBinding lowLevelEngineFactory( bool realtime ) const override;

        outcome::result<void> registerRequest( const RecordPtr &record ) override;

        /**
         * @brief Adds a request loaded from durable storage, without
         * notifying listeners
         */
        outcome::result<void> resumeRequest( const RecordPtr &record );

        /**
         * @return the request or nullptr
         */
        RecordPtr getRequest( const std::string &identifier ) const;

        std::vector<RecordPtr> requests() const;

        std::vector<request::PersistentRequestTag> persistentTags() const;

        /**
         * @brief Cancels a request, which removes it
         * @return REQUEST_NOT_FOUND
         */
        outcome::result<void> removeByIdentifier( const std::string &identifier, request::RequestContext &ctx );

        /**
         * @brief Removes a finished request the client has seen
         * @return REQUEST_NOT_FOUND or NOT_FINISHED
         */
        outcome::result<void> acknowledge( const std::string &identifier, request::RequestContext &ctx );

        RequestStatusCache &statusCache() override
        {
            return cache_;
        }

        /**
         * @brief Listeners are held weakly
         */
        void subscribe( const std::shared_ptr<RequestEventListener> &listener );

        void unsubscribe( const std::shared_ptr<RequestEventListener> &listener );

        void finishedClientRequest( const RecordPtr &record, request::RequestContext &ctx ) override;

        void requestRemoved( const RecordPtr &record ) override;

        void requestModified( const request::PersistentRequestModified &modification ) override;

        void requestStatusUpdated( const request::RequestIdentity &identity ) override;

    private:
        outcome::result<void> addRequest( const RecordPtr &record );

        std::vector<std::shared_ptr<RequestEventListener>> liveListeners() const;

        const bool                         shared_;
        const boost::optional<std::string> name_;
        const request::DurabilityTier      tier_;
        const ClientLimits                 limits_;

        mutable std::mutex                               mutex_;
        std::map<std::string, RecordPtr>                 requests_;
        std::deque<std::string>                          finished_order_;
        std::vector<std::weak_ptr<RequestEventListener>> listeners_;
        RequestStatusCache                               cache_;

        base::Logger logger_ = base::createLogger( "ClientEntry" );
    };
}

#endif // REQKEEP_CLIENT_CLIENT_ENTRY_HPP
