#ifndef REQKEEP_CODEC_BYTE_STREAM_HPP
#define REQKEEP_CODEC_BYTE_STREAM_HPP

#include <cstdint>
#include <string>

#include <boost/optional.hpp>

#include "base/buffer.hpp"
#include "codec/codec_error.hpp"

namespace reqkeep::codec
{
    /// Longest string, in bytes, that fits the 16-bit length prefix
    constexpr size_t kMaxUtfLength = 0xFFFF;

    /**
     * @brief Appends fixed-width big-endian values to a buffer, in the layout
     * of a Java DataOutputStream. Strings are written as a 16-bit byte length
     * followed by the UTF-8 bytes.
     */
    class ByteWriter
    {
    public:
        ByteWriter() = default;

        void writeBool( bool value );
        void writeUint8( uint8_t value );
        void writeUint16( uint16_t value );
        void writeInt16( int16_t value );
        void writeUint32( uint32_t value );
        void writeInt32( int32_t value );
        void writeUint64( uint64_t value );
        void writeInt64( int64_t value );

        outcome::result<void> writeUtf( const std::string &value );

        /**
         * @brief Writes a presence flag, then the string if present
         */
        outcome::result<void> writeOptionalUtf( const boost::optional<std::string> &value );

        [[nodiscard]] const base::Buffer &buffer() const
        {
            return buffer_;
        }

        base::Buffer release()
        {
            return std::move( buffer_ );
        }

    private:
        base::Buffer buffer_;
    };

    /**
     * @brief Reads values written by ByteWriter. Does not own the data, the
     * source buffer must outlive the reader.
     */
    class ByteReader
    {
    public:
        explicit ByteReader( const base::Buffer &source );

        ByteReader( const uint8_t *data, size_t size );

        outcome::result<bool>     readBool();
        outcome::result<uint8_t>  readUint8();
        outcome::result<uint16_t> readUint16();
        outcome::result<int16_t>  readInt16();
        outcome::result<uint32_t> readUint32();
        outcome::result<int32_t>  readInt32();
        outcome::result<uint64_t> readUint64();
        outcome::result<int64_t>  readInt64();

        outcome::result<std::string> readUtf();

        outcome::result<boost::optional<std::string>> readOptionalUtf();

        [[nodiscard]] size_t remaining() const
        {
            return size_ - offset_;
        }

        [[nodiscard]] size_t position() const
        {
            return offset_;
        }

        /**
         * @return TRAILING_DATA if anything is left unread
         */
        outcome::result<void> expectEnd() const;

    private:
        outcome::result<uint64_t> readBigEndian( size_t width );

        const uint8_t *data_;
        size_t         size_;
        size_t         offset_ = 0;
    };
}

#endif // REQKEEP_CODEC_BYTE_STREAM_HPP
