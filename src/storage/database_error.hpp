#ifndef REQKEEP_STORAGE_DATABASE_ERROR_HPP
#define REQKEEP_STORAGE_DATABASE_ERROR_HPP

#include <ostream>

#include "outcome/outcome.hpp"

namespace reqkeep::storage
{
    /**
     * @brief universal database interface error
     */
    enum class DatabaseError : int
    {
        OK               = 0,
        NOT_FOUND        = 1,
        CORRUPTION       = 2,
        NOT_SUPPORTED    = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR         = 5,

        UNKNOWN = 1000
    };

    std::ostream &operator<<( std::ostream &out, const DatabaseError &error );
}

OUTCOME_HPP_DECLARE_ERROR_2( reqkeep::storage, DatabaseError );

#endif // REQKEEP_STORAGE_DATABASE_ERROR_HPP
