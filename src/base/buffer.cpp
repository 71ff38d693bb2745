#include "base/buffer.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ostream>

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY_3( reqkeep::base, BufferError, e )
{
    using E = reqkeep::base::BufferError;
    switch ( e )
    {
        case E::NOT_ENOUGH_INPUT:
            return "hex string has odd length";
        case E::NON_HEX_INPUT:
            return "hex string contains a non-hex character";
    }
    return "unknown BufferError";
}

namespace reqkeep::base
{
    Buffer::Buffer( std::vector<uint8_t> bytes ) : data_( std::move( bytes ) )
    {
    }

    Buffer::Buffer( const uint8_t *begin, const uint8_t *end ) : data_( begin, end )
    {
    }

    Buffer::Buffer( std::initializer_list<uint8_t> bytes ) : data_( bytes )
    {
    }

    size_t Buffer::size() const
    {
        return data_.size();
    }

    bool Buffer::empty() const
    {
        return data_.empty();
    }

    const uint8_t *Buffer::data() const
    {
        return data_.data();
    }

    uint8_t *Buffer::data()
    {
        return data_.data();
    }

    uint8_t &Buffer::operator[]( size_t index )
    {
        return data_[index];
    }

    const uint8_t &Buffer::operator[]( size_t index ) const
    {
        return data_[index];
    }

    Buffer::iterator Buffer::begin()
    {
        return data_.begin();
    }

    Buffer::iterator Buffer::end()
    {
        return data_.end();
    }

    Buffer::const_iterator Buffer::begin() const
    {
        return data_.begin();
    }

    Buffer::const_iterator Buffer::end() const
    {
        return data_.end();
    }

    void Buffer::clear()
    {
        data_.clear();
    }

    void Buffer::reserve( size_t size )
    {
        data_.reserve( size );
    }

    Buffer &Buffer::put( std::string_view view )
    {
        data_.insert( data_.end(), view.begin(), view.end() );
        return *this;
    }

    Buffer &Buffer::put( const std::vector<uint8_t> &bytes )
    {
        data_.insert( data_.end(), bytes.begin(), bytes.end() );
        return *this;
    }

    Buffer &Buffer::putBuffer( const Buffer &other )
    {
        return put( other.data_ );
    }

    Buffer &Buffer::putUint8( uint8_t value )
    {
        data_.push_back( value );
        return *this;
    }

    Buffer &Buffer::putUint32( uint32_t value )
    {
        data_.push_back( static_cast<uint8_t>( value >> 24u ) );
        data_.push_back( static_cast<uint8_t>( value >> 16u ) );
        data_.push_back( static_cast<uint8_t>( value >> 8u ) );
        data_.push_back( static_cast<uint8_t>( value ) );
        return *this;
    }

    bool Buffer::startsWith( const Buffer &prefix ) const
    {
        return prefix.size() <= size() && std::equal( prefix.begin(), prefix.end(), begin() );
    }

    Buffer Buffer::subbuffer( size_t offset, size_t length ) const
    {
        offset = std::min( offset, size() );
        length = std::min( length, size() - offset );
        return Buffer( data() + offset, data() + offset + length );
    }

    const std::vector<uint8_t> &Buffer::toVector() const
    {
        return data_;
    }

    std::string Buffer::toString() const
    {
        return std::string( data_.begin(), data_.end() );
    }

    std::string Buffer::toHex() const
    {
        std::string out;
        out.reserve( data_.size() * 2 );
        boost::algorithm::hex_lower( data_.begin(), data_.end(), std::back_inserter( out ) );
        return out;
    }

    outcome::result<Buffer> Buffer::fromHex( std::string_view hex )
    {
        if ( hex.size() % 2 != 0 )
        {
            return BufferError::NOT_ENOUGH_INPUT;
        }
        auto is_hex = []( char c ) { return std::isxdigit( static_cast<unsigned char>( c ) ) != 0; };
        if ( !std::all_of( hex.begin(), hex.end(), is_hex ) )
        {
            return BufferError::NON_HEX_INPUT;
        }
        std::vector<uint8_t> bytes;
        bytes.reserve( hex.size() / 2 );
        boost::algorithm::unhex( hex.begin(), hex.end(), std::back_inserter( bytes ) );
        return Buffer( std::move( bytes ) );
    }

    Buffer Buffer::fromString( std::string_view str )
    {
        return Buffer().put( str );
    }

    bool Buffer::operator==( const Buffer &other ) const
    {
        return data_ == other.data_;
    }

    bool Buffer::operator!=( const Buffer &other ) const
    {
        return data_ != other.data_;
    }

    bool Buffer::operator<( const Buffer &other ) const
    {
        return data_ < other.data_;
    }

    std::ostream &operator<<( std::ostream &os, const Buffer &buffer )
    {
        return os << buffer.toHex();
    }
}
