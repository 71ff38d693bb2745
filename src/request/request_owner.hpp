#ifndef REQKEEP_REQUEST_REQUEST_OWNER_HPP
#define REQKEEP_REQUEST_REQUEST_OWNER_HPP

#include <memory>

#include "outcome/outcome.hpp"
#include "request/durability_tier.hpp"
#include "request/engine.hpp"
#include "request/request_tag.hpp"

namespace reqkeep::client
{
    class RequestStatusCache;
}

namespace reqkeep::request
{
    class RequestRecord;
    struct RequestContext;

    /**
     * Holder of a set of requests: a client entry or a connection session.
     * Records call back into their owner outside of the record lock.
     */
    class RequestOwner
    {
    public:
        virtual ~RequestOwner() = default;

        virtual DurabilityTier tier() const = 0;

        /**
         * @brief Engine binding for requests of this owner in the given band
         */
        virtual EngineBinding lowLevelEngineFactory( bool realtime ) const = 0;

        /**
         * @return IDENTIFIER_COLLISION if the identifier is taken
         */
        virtual outcome::result<void> registerRequest( const std::shared_ptr<RequestRecord> &record ) = 0;

        virtual void finishedClientRequest( const std::shared_ptr<RequestRecord> &record, RequestContext &ctx ) = 0;

        virtual void requestRemoved( const std::shared_ptr<RequestRecord> &record ) = 0;

        virtual void requestModified( const PersistentRequestModified &modification ) = 0;

        virtual void requestStatusUpdated( const RequestIdentity &identity ) = 0;

        virtual client::RequestStatusCache &statusCache() = 0;
    };
}

#endif // REQKEEP_REQUEST_REQUEST_OWNER_HPP
