#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( reqkeep::application, ConfigReaderError, e )
{
    using E = reqkeep::application::ConfigReaderError;
    switch ( e )
    {
        case E::MISSING_ENTRY:
            return "A required entry is missing in the provided config file";
        case E::PARSER_ERROR:
            return "Internal parser error";
        case E::INVALID_VALUE:
            return "An entry of the provided config file has an invalid value";
    }
    return "Unknown error";
}
