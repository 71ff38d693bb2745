#include "storage/in_memory/in_memory_storage.hpp"

#include <iterator>

#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/in_memory/in_memory_cursor.hpp"

using reqkeep::base::Buffer;

namespace reqkeep::storage
{
    outcome::result<Buffer> InMemoryStorage::get( const Buffer &key ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        it = storage_.find( key );
        if ( it != storage_.end() )
        {
            return it->second;
        }

        return DatabaseError::NOT_FOUND;
    }

    outcome::result<void> InMemoryStorage::put( const Buffer &key, const Buffer &value )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        storage_[key] = value;
        return outcome::success();
    }

    outcome::result<void> InMemoryStorage::put( const Buffer &key, Buffer &&value )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        storage_[key] = std::move( value );
        return outcome::success();
    }

    bool InMemoryStorage::contains( const Buffer &key ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return storage_.find( key ) != storage_.end();
    }

    bool InMemoryStorage::empty() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return storage_.empty();
    }

    size_t InMemoryStorage::size() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return storage_.size();
    }

    outcome::result<void> InMemoryStorage::remove( const Buffer &key )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        storage_.erase( key );
        return outcome::success();
    }

    std::unique_ptr<BufferBatch> InMemoryStorage::batch()
    {
        return std::make_unique<InMemoryBatch>( *this );
    }

    std::unique_ptr<BufferMapCursor> InMemoryStorage::cursor()
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return std::make_unique<Cursor>( storage_ );
    }

    InMemoryStorage::Cursor::Cursor( std::map<Buffer, Buffer> snapshot ) :
        snapshot_( std::move( snapshot ) ), it_( snapshot_.end() )
    {
    }

    outcome::result<void> InMemoryStorage::Cursor::seekToFirst()
    {
        it_ = snapshot_.begin();
        return outcome::success();
    }

    outcome::result<void> InMemoryStorage::Cursor::seek( const Buffer &key )
    {
        it_ = snapshot_.lower_bound( key );
        return outcome::success();
    }

    outcome::result<void> InMemoryStorage::Cursor::seekToLast()
    {
        it_ = snapshot_.empty() ? snapshot_.end() : std::prev( snapshot_.end() );
        return outcome::success();
    }

    bool InMemoryStorage::Cursor::isValid() const
    {
        return it_ != snapshot_.end();
    }

    outcome::result<void> InMemoryStorage::Cursor::next()
    {
        if ( it_ != snapshot_.end() )
        {
            ++it_;
        }
        return outcome::success();
    }

    outcome::result<void> InMemoryStorage::Cursor::prev()
    {
        if ( it_ == snapshot_.begin() )
        {
            it_ = snapshot_.end();
        }
        else if ( it_ != snapshot_.end() )
        {
            --it_;
        }
        return outcome::success();
    }

    outcome::result<Buffer> InMemoryStorage::Cursor::key() const
    {
        if ( !isValid() )
        {
            return DatabaseError::NOT_FOUND;
        }
        return it_->first;
    }

    outcome::result<Buffer> InMemoryStorage::Cursor::value() const
    {
        if ( !isValid() )
        {
            return DatabaseError::NOT_FOUND;
        }
        return it_->second;
    }
}
