#ifndef REQKEEP_STORAGE_ROCKSDB_UTIL_HPP
#define REQKEEP_STORAGE_ROCKSDB_UTIL_HPP

#include <rocksdb/status.h>

#include "base/buffer.hpp"
#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "storage/database_error.hpp"

namespace reqkeep::storage
{
    template <typename T>
    outcome::result<T> error_as_result( const ::ROCKSDB_NAMESPACE::Status &s )
    {
        if ( s.IsNotFound() )
        {
            return DatabaseError::NOT_FOUND;
        }

        if ( s.IsIOError() )
        {
            return DatabaseError::IO_ERROR;
        }

        if ( s.IsInvalidArgument() )
        {
            return DatabaseError::INVALID_ARGUMENT;
        }

        if ( s.IsCorruption() )
        {
            return DatabaseError::CORRUPTION;
        }

        if ( s.IsNotSupported() )
        {
            return DatabaseError::NOT_SUPPORTED;
        }

        return DatabaseError::UNKNOWN;
    }

    template <typename T>
    outcome::result<T> error_as_result( const ::ROCKSDB_NAMESPACE::Status &s, const base::Logger &logger )
    {
        logger->error( s.ToString() );
        return error_as_result<T>( s );
    }

    inline ::ROCKSDB_NAMESPACE::Slice make_slice( const base::Buffer &buf )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto *ptr = reinterpret_cast<const char *>( buf.data() );
        return ::ROCKSDB_NAMESPACE::Slice{ ptr, buf.size() };
    }

    inline base::Buffer make_buffer( const ::ROCKSDB_NAMESPACE::Slice &s )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto *ptr = reinterpret_cast<const uint8_t *>( s.data() );
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return base::Buffer( ptr, ptr + s.size() );
    }
}

#endif // REQKEEP_STORAGE_ROCKSDB_UTIL_HPP
