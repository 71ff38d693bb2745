#ifndef REQKEEP_BASE_BUFFER_HPP
#define REQKEEP_BASE_BUFFER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace reqkeep::base
{

    /**
     * @brief Growable byte array used as key and value type of the storages
     * and as the sink of the record encoders
     */
    class Buffer
    {
    public:
        using iterator       = std::vector<uint8_t>::iterator;
        using const_iterator = std::vector<uint8_t>::const_iterator;
        using value_type     = uint8_t;

        Buffer() = default;

        explicit Buffer( std::vector<uint8_t> bytes );

        Buffer( const uint8_t *begin, const uint8_t *end );

        Buffer( std::initializer_list<uint8_t> bytes );

        [[nodiscard]] size_t size() const;

        [[nodiscard]] bool empty() const;

        [[nodiscard]] const uint8_t *data() const;

        uint8_t *data();

        uint8_t &operator[]( size_t index );

        const uint8_t &operator[]( size_t index ) const;

        iterator begin();
        iterator end();

        [[nodiscard]] const_iterator begin() const;
        [[nodiscard]] const_iterator end() const;

        void clear();

        void reserve( size_t size );

        /**
         * @brief Append a string as raw bytes
         * @return this buffer
         */
        Buffer &put( std::string_view view );

        /**
         * @brief Append raw bytes
         * @return this buffer
         */
        Buffer &put( const std::vector<uint8_t> &bytes );

        Buffer &putBuffer( const Buffer &other );

        Buffer &putUint8( uint8_t value );

        /**
         * @brief Append a 32-bit unsigned number in big-endian order
         */
        Buffer &putUint32( uint32_t value );

        [[nodiscard]] bool startsWith( const Buffer &prefix ) const;

        /**
         * @return copy of bytes [offset, offset + length)
         */
        [[nodiscard]] Buffer subbuffer( size_t offset, size_t length ) const;

        [[nodiscard]] const std::vector<uint8_t> &toVector() const;

        [[nodiscard]] std::string toString() const;

        [[nodiscard]] std::string toHex() const;

        static outcome::result<Buffer> fromHex( std::string_view hex );

        static Buffer fromString( std::string_view str );

        bool operator==( const Buffer &other ) const;

        bool operator!=( const Buffer &other ) const;

        bool operator<( const Buffer &other ) const;

    private:
        std::vector<uint8_t> data_;
    };

    std::ostream &operator<<( std::ostream &os, const Buffer &buffer );

    /**
     * @brief Errors of hex conversion
     */
    enum class BufferError
    {
        NOT_ENOUGH_INPUT = 1,
        NON_HEX_INPUT,
    };

}

OUTCOME_HPP_DECLARE_ERROR_2( reqkeep::base, BufferError );

#endif // REQKEEP_BASE_BUFFER_HPP
