#ifndef REQKEEP_CODEC_CHECKSUM_CHECKER_HPP
#define REQKEEP_CODEC_CHECKSUM_CHECKER_HPP

#include "base/buffer.hpp"
#include "outcome/outcome.hpp"

namespace reqkeep::codec
{
    /**
     * @brief Frames stored values with a trailing big-endian CRC-32 of the
     * payload
     */
    class ChecksumChecker
    {
    public:
        static constexpr size_t kChecksumLength = 4;

        static uint32_t checksum( const uint8_t *data, size_t size );

        /**
         * @return payload followed by its checksum
         */
        static base::Buffer appendChecksum( const base::Buffer &payload );

        /**
         * @brief Verify the trailing checksum
         * @return payload without the checksum, or CHECKSUM_MISMATCH /
         * NOT_ENOUGH_DATA
         */
        static outcome::result<base::Buffer> verifyAndStrip( const base::Buffer &framed );
    };
}

#endif // REQKEEP_CODEC_CHECKSUM_CHECKER_HPP
