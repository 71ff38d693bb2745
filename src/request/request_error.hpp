#ifndef REQKEEP_REQUEST_REQUEST_ERROR_HPP
#define REQKEEP_REQUEST_REQUEST_ERROR_HPP

#include <system_error>

#include "outcome/outcome.hpp"

namespace reqkeep::request
{
    /**
     * Codes for errors of request lifecycle operations
     */
    enum class RequestError
    {
        PERSISTENCE_DISABLED = 1, ///< durable job refused, the operation is abandoned
        CANNOT_RESTART,           ///< illegal transition
        REQUEST_CANCELLED,        ///< illegal transition
        NOT_FINISHED,             ///< illegal transition
        IDENTIFIER_COLLISION,
        REQUEST_NOT_FOUND,
        INVALID_PRIORITY,
        INVALID_IDENTITY,
        BINDING_MISMATCH,
        TIER_MISMATCH,
        NOT_PERSISTENT,
        RESUME_FAILED,
        UNKNOWN_DURABILITY_TIER,
        ENGINE_UNAVAILABLE,
    };

    /**
     * @return true for transitions rejected because of the record's state
     */
    bool isIllegalTransition( const std::error_code &ec );
}

OUTCOME_HPP_DECLARE_ERROR_2( reqkeep::request, RequestError );

#endif // REQKEEP_REQUEST_REQUEST_ERROR_HPP
