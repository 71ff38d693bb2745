

#include "codec/codec_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( reqkeep::codec, EncodeError, e )
{
    using reqkeep::codec::EncodeError;
    switch ( e )
    {
        case EncodeError::STRING_TOO_LONG:
            return "string is too long to be encoded";
    }
    return "unknown EncodeError";
}

OUTCOME_CPP_DEFINE_CATEGORY_3( reqkeep::codec, DecodeError, e )
{
    using reqkeep::codec::DecodeError;
    switch ( e )
    {
        case DecodeError::NOT_ENOUGH_DATA:
            return "not enough data to decode";
        case DecodeError::BAD_MAGIC:
            return "bad magic";
        case DecodeError::BAD_VERSION:
            return "bad version";
        case DecodeError::IDENTITY_MISMATCH:
            return "request identifier has changed";
        case DecodeError::BOGUS_PRIORITY:
            return "bogus priority";
        case DecodeError::UNKNOWN_REQUEST_KIND:
            return "unknown request kind";
        case DecodeError::INVALID_DATA:
            return "incorrect source data";
        case DecodeError::CHECKSUM_MISMATCH:
            return "checksum mismatch";
        case DecodeError::TRAILING_DATA:
            return "unexpected data after the last field";
    }
    return "unknown DecodeError";
}

namespace reqkeep::codec
{
    bool isFormatError( const std::error_code &ec )
    {
        return ec.category() == make_error_code( DecodeError::NOT_ENOUGH_DATA ).category();
    }
}
