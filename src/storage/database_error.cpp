#include "storage/database_error.hpp"

namespace reqkeep::storage
{
    std::ostream &operator<<( std::ostream &out, const DatabaseError &error )
    {
        return out << make_error_code( error ).message();
    }
}

OUTCOME_CPP_DEFINE_CATEGORY_3( reqkeep::storage, DatabaseError, e )
{
    using E = reqkeep::storage::DatabaseError;
    switch ( e )
    {
        case E::OK:
            return "success";
        case E::NOT_SUPPORTED:
            return "operation is not supported";
        case E::CORRUPTION:
            return "data corruption";
        case E::INVALID_ARGUMENT:
            return "invalid argument";
        case E::IO_ERROR:
            return "IO error";
        case E::NOT_FOUND:
            return "not found";
        case E::UNKNOWN:
            break;
    }

    return "unknown error";
}
