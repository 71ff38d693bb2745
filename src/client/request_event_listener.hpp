#ifndef REQKEEP_CLIENT_REQUEST_EVENT_LISTENER_HPP
#define REQKEEP_CLIENT_REQUEST_EVENT_LISTENER_HPP

#include "client/request_status_cache.hpp"
#include "request/request_identity.hpp"
#include "request/request_tag.hpp"

namespace reqkeep::client
{
    /**
     * Receives the notifications a protocol layer turns into client messages
     */
    class RequestEventListener
    {
    public:
        virtual ~RequestEventListener() = default;

        virtual void onStatusUpdated( const RequestStatus &status ) = 0;

        virtual void onRequestModified( const request::PersistentRequestModified &modification ) = 0;

        virtual void onRequestFinished( const request::PersistentRequestTag &tag ) = 0;

        virtual void onRequestRemoved( const request::RequestIdentity &identity ) = 0;
    };
}

#endif // REQKEEP_CLIENT_REQUEST_EVENT_LISTENER_HPP
