#include "codec/byte_stream.hpp"


namespace reqkeep::codec
{
    void ByteWriter::writeBool( bool value )
    {
        buffer_.putUint8( value ? 1 : 0 );
    }

    void ByteWriter::writeUint8( uint8_t value )
    {
        buffer_.putUint8( value );
    }

    void ByteWriter::writeUint16( uint16_t value )
    {
        buffer_.putUint8( static_cast<uint8_t>( value >> 8u ) );
        buffer_.putUint8( static_cast<uint8_t>( value ) );
    }

    void ByteWriter::writeInt16( int16_t value )
    {
        writeUint16( static_cast<uint16_t>( value ) );
    }

    void ByteWriter::writeUint32( uint32_t value )
    {
        buffer_.putUint32( value );
    }

    void ByteWriter::writeInt32( int32_t value )
    {
        writeUint32( static_cast<uint32_t>( value ) );
    }

    void ByteWriter::writeUint64( uint64_t value )
    {
        writeUint32( static_cast<uint32_t>( value >> 32u ) );
        writeUint32( static_cast<uint32_t>( value ) );
    }

    void ByteWriter::writeInt64( int64_t value )
    {
        writeUint64( static_cast<uint64_t>( value ) );
    }

    outcome::result<void> ByteWriter::writeUtf( const std::string &value )
    {
        if ( value.size() > kMaxUtfLength )
        {
            return EncodeError::STRING_TOO_LONG;
        }
        writeUint16( static_cast<uint16_t>( value.size() ) );
        buffer_.put( value );
        return outcome::success();
    }

    outcome::result<void> ByteWriter::writeOptionalUtf( const boost::optional<std::string> &value )
    {
        writeBool( value.has_value() );
        if ( value )
        {
            return writeUtf( *value );
        }
        return outcome::success();
    }

    ByteReader::ByteReader( const base::Buffer &source ) : ByteReader( source.data(), source.size() )
    {
    }

    ByteReader::ByteReader( const uint8_t *data, size_t size ) : data_( data ), size_( size )
    {
    }

    outcome::result<uint64_t> ByteReader::readBigEndian( size_t width )
    {
        if ( remaining() < width )
        {
            return DecodeError::NOT_ENOUGH_DATA;
        }
        uint64_t value = 0;
        for ( size_t i = 0; i < width; ++i )
        {
            value = ( value << 8u ) | data_[offset_ + i];
        }
        offset_ += width;
        return value;
    }

    outcome::result<bool> ByteReader::readBool()
    {
        OUTCOME_TRY( auto byte, readUint8() );
        if ( byte > 1 )
        {
            return DecodeError::INVALID_DATA;
        }
        return byte == 1;
    }

    outcome::result<uint8_t> ByteReader::readUint8()
    {
        OUTCOME_TRY( auto value, readBigEndian( 1 ) );
        return static_cast<uint8_t>( value );
    }

    outcome::result<uint16_t> ByteReader::readUint16()
    {
        OUTCOME_TRY( auto value, readBigEndian( 2 ) );
        return static_cast<uint16_t>( value );
    }

    outcome::result<int16_t> ByteReader::readInt16()
    {
        OUTCOME_TRY( auto value, readUint16() );
        return static_cast<int16_t>( value );
    }

    outcome::result<uint32_t> ByteReader::readUint32()
    {
        OUTCOME_TRY( auto value, readBigEndian( 4 ) );
        return static_cast<uint32_t>( value );
    }

    outcome::result<int32_t> ByteReader::readInt32()
    {
        OUTCOME_TRY( auto value, readUint32() );
        return static_cast<int32_t>( value );
    }

    outcome::result<uint64_t> ByteReader::readUint64()
    {
        return readBigEndian( 8 );
    }

    outcome::result<int64_t> ByteReader::readInt64()
    {
        OUTCOME_TRY( auto value, readUint64() );
        return static_cast<int64_t>( value );
    }

    outcome::result<std::string> ByteReader::readUtf()
    {
        OUTCOME_TRY( auto length, readUint16() );
        if ( remaining() < length )
        {
            return DecodeError::NOT_ENOUGH_DATA;
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        std::string value( reinterpret_cast<const char *>( data_ + offset_ ), length );
        offset_ += length;
        return value;
    }

    outcome::result<boost::optional<std::string>> ByteReader::readOptionalUtf()
    {
        OUTCOME_TRY( auto present, readBool() );
        if ( !present )
        {
            return boost::optional<std::string>{};
        }
        OUTCOME_TRY( auto value, readUtf() );
        return boost::make_optional( std::move( value ) );
    }

    outcome::result<void> ByteReader::expectEnd() const
    {
        if ( remaining() != 0 )
        {
            return DecodeError::TRAILING_DATA;
        }
        return outcome::success();
    }
}
