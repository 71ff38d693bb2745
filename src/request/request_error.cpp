#include "request/request_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( reqkeep::request, RequestError, e )
{
    using E = reqkeep::request::RequestError;
    switch ( e )
    {
        case E::PERSISTENCE_DISABLED:
            return "persistence is disabled";
        case E::CANNOT_RESTART:
            return "request cannot be restarted";
        case E::REQUEST_CANCELLED:
            return "request has been cancelled";
        case E::NOT_FINISHED:
            return "request has not finished yet";
        case E::IDENTIFIER_COLLISION:
            return "identifier is already used on this queue";
        case E::REQUEST_NOT_FOUND:
            return "no such request";
        case E::INVALID_PRIORITY:
            return "priority class out of range";
        case E::INVALID_IDENTITY:
            return "client name must be absent exactly for the shared queue";
        case E::BINDING_MISMATCH:
            return "engine binding persistence does not match the durability tier";
        case E::TIER_MISMATCH:
            return "client durability tier does not match the request";
        case E::NOT_PERSISTENT:
            return "request is not crash persistent";
        case E::RESUME_FAILED:
            return "request could not be resumed";
        case E::UNKNOWN_DURABILITY_TIER:
            return "unknown durability tier";
        case E::ENGINE_UNAVAILABLE:
            return "no engine handle for the request";
    }
    return "unknown RequestError";
}

namespace reqkeep::request
{
    bool isIllegalTransition( const std::error_code &ec )
    {
        return ec == RequestError::CANNOT_RESTART || ec == RequestError::REQUEST_CANCELLED
            || ec == RequestError::NOT_FINISHED;
    }
}
