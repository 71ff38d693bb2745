

#ifndef REQKEEP_CODEC_CODEC_ERROR_HPP
#define REQKEEP_CODEC_CODEC_ERROR_HPP

#include <system_error>

#include "outcome/outcome.hpp"

namespace reqkeep::codec
{
    /**
     * @brief EncodeError enum provides error codes for encode methods
     */
    enum class EncodeError
    {                        // 0 is reserved for success
        STRING_TOO_LONG = 1, ///< utf string does not fit a 16-bit length prefix
    };

    /**
     * @brief DecodeError enum provides codes of errors for decode methods.
     * Every DecodeError is a format error: the record that produced it cannot
     * be resumed.
     */
    enum class DecodeError
    {                        // 0 is reserved for success
        NOT_ENOUGH_DATA = 1, ///< not enough data to decode value
        BAD_MAGIC,           ///< record does not start with the expected magic
        BAD_VERSION,         ///< unsupported record format version
        IDENTITY_MISMATCH,   ///< record belongs to another request
        BOGUS_PRIORITY,      ///< priority class outside of the legal range
        UNKNOWN_REQUEST_KIND,///< request kind ordinal is not known
        INVALID_DATA,        ///< malformed field value
        CHECKSUM_MISMATCH,   ///< stored value failed checksum verification
        TRAILING_DATA,       ///< bytes left after the last field
    };

    /**
     * @return true if the error was produced while decoding a record
     */
    bool isFormatError( const std::error_code &ec );
}

OUTCOME_HPP_DECLARE_ERROR_2( reqkeep::codec, EncodeError );
OUTCOME_HPP_DECLARE_ERROR_2( reqkeep::codec, DecodeError );

#endif // REQKEEP_CODEC_CODEC_ERROR_HPP
