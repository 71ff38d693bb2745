#include "codec/checksum_checker.hpp"

#include <boost/crc.hpp>

#include "codec/codec_error.hpp"

namespace reqkeep::codec
{
    uint32_t ChecksumChecker::checksum( const uint8_t *data, size_t size )
    {
        boost::crc_32_type crc;
        crc.process_bytes( data, size );
        return crc.checksum();
    }

    base::Buffer ChecksumChecker::appendChecksum( const base::Buffer &payload )
    {
        base::Buffer framed;
        framed.reserve( payload.size() + kChecksumLength );
        framed.putBuffer( payload );
        framed.putUint32( checksum( payload.data(), payload.size() ) );
        return framed;
    }

    outcome::result<base::Buffer> ChecksumChecker::verifyAndStrip( const base::Buffer &framed )
    {
        if ( framed.size() < kChecksumLength )
        {
            return DecodeError::NOT_ENOUGH_DATA;
        }
        const size_t payload_size = framed.size() - kChecksumLength;

        uint32_t stored = 0;
        for ( size_t i = payload_size; i < framed.size(); ++i )
        {
            stored = ( stored << 8u ) | framed[i];
        }
        if ( stored != checksum( framed.data(), payload_size ) )
        {
            return DecodeError::CHECKSUM_MISMATCH;
        }
        return framed.subbuffer( 0, payload_size );
    }
}
