#ifndef REQKEEP_TEST_MOCK_CLIENT_REQUEST_EVENT_LISTENER_MOCK_HPP
#define REQKEEP_TEST_MOCK_CLIENT_REQUEST_EVENT_LISTENER_MOCK_HPP

#include <gmock/gmock.h>

#include "client/request_event_listener.hpp"

namespace reqkeep::client
{
    class RequestEventListenerMock : public RequestEventListener
    {
    public:
        MOCK_METHOD1( onStatusUpdated, void( const RequestStatus & ) );
        MOCK_METHOD1( onRequestModified, void( const request::PersistentRequestModified & ) );
        MOCK_METHOD1( onRequestFinished, void( const request::PersistentRequestTag & ) );
        MOCK_METHOD1( onRequestRemoved, void( const request::RequestIdentity & ) );
    };
}

#endif // REQKEEP_TEST_MOCK_CLIENT_REQUEST_EVENT_LISTENER_MOCK_HPP
