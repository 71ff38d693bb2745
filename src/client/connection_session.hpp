#ifndef REQKEEP_CLIENT_CONNECTION_SESSION_HPP
#define REQKEEP_CLIENT_CONNECTION_SESSION_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "base/logger.hpp"
#include "client/request_event_listener.hpp"
#include "client/request_status_cache.hpp"
#include "request/request_owner.hpp"
#include "request/request_record.hpp"

namespace reqkeep::client
{
    /**
     * @brief One client connection. Owns the CONNECTION_SCOPED requests
     * started over it, which end with the connection.
     */
    class ConnectionSession : public request::RequestOwner, public std::enable_shared_from_this<ConnectionSession>
    {
    public:
        using RecordPtr = request::RequestRecord::Ptr;

        /**
         * @param name - client name given in the handshake
         * @param listener - receives the notifications of this session, may be null
         */
        explicit ConnectionSession( std::string name, std::shared_ptr<RequestEventListener> listener = nullptr );

        ~ConnectionSession() override = default;

        const std::string &name() const
        {
            return name_;
        }

        request::DurabilityTier tier() const override
        {
            return request::DurabilityTier::CONNECTION_SCOPED;
        }

        request::EngineBinding lowLevelEngineFactory( bool realtime ) const override
        {
            return { false, realtime };
        }

        outcome::result<void> registerRequest( const RecordPtr &record ) override;

        RecordPtr getRequest( const std::string &identifier ) const;

        std::vector<RecordPtr> requests() const;

        /**
         * @return REQUEST_NOT_FOUND
         */
        outcome::result<void> removeByIdentifier( const std::string &identifier, request::RequestContext &ctx );

        /**
         * @brief Cancels every request of the session
         */
        void onLostConnection( request::RequestContext &ctx );

        RequestStatusCache &statusCache() override
        {
            return cache_;
        }

        void finishedClientRequest( const RecordPtr &record, request::RequestContext &ctx ) override;

        void requestRemoved( const RecordPtr &record ) override;

        void requestModified( const request::PersistentRequestModified &modification ) override;

        void requestStatusUpdated( const request::RequestIdentity &identity ) override;

    private:
        /// Erases the record if it is still registered
        bool erase( const RecordPtr &record );

        const std::string                           name_;
        const std::shared_ptr<RequestEventListener> listener_;

        mutable std::mutex               mutex_;
        std::map<std::string, RecordPtr> requests_;
        RequestStatusCache               cache_;

        base::Logger logger_ = base::createLogger( "ConnectionSession" );
    };
}

#endif // REQKEEP_CLIENT_CONNECTION_SESSION_HPP
