#ifndef REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_BATCH_HPP
#define REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_BATCH_HPP

#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "base/buffer.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace reqkeep::storage
{
    using reqkeep::base::Buffer;

    class InMemoryBatch : public BufferBatch
    {
    public:
        explicit InMemoryBatch( InMemoryStorage &db ) : db_{ db }
        {
        }

        outcome::result<void> put( const Buffer &key, const Buffer &value ) override
        {
            operations_.emplace_back( key, value );
            return outcome::success();
        }

        outcome::result<void> put( const Buffer &key, Buffer &&value ) override
        {
            operations_.emplace_back( key, std::move( value ) );
            return outcome::success();
        }

        outcome::result<void> remove( const Buffer &key ) override
        {
            operations_.emplace_back( key, boost::none );
            return outcome::success();
        }

        outcome::result<void> commit() override
        {
            std::lock_guard<std::mutex> lock( db_.mutex_ );
            for ( auto &[key, value] : operations_ )
            {
                if ( value )
                {
                    db_.storage_[key] = std::move( *value );
                }
                else
                {
                    db_.storage_.erase( key );
                }
            }
            operations_.clear();
            return outcome::success();
        }

        void clear() override
        {
            operations_.clear();
        }

    private:
        // none marks a removal
        std::vector<std::pair<Buffer, boost::optional<Buffer>>> operations_;
        InMemoryStorage                                        &db_;
    };
}

#endif // REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_BATCH_HPP
