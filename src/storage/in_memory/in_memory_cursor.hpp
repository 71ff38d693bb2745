#ifndef REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_CURSOR_HPP
#define REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_CURSOR_HPP

#include <map>

#include "storage/in_memory/in_memory_storage.hpp"

namespace reqkeep::storage
{
    /**
     * @brief Cursor over a copy of the storage contents taken at creation
     */
    class InMemoryStorage::Cursor : public BufferMapCursor
    {
    public:
        explicit Cursor( std::map<Buffer, Buffer> snapshot );

        ~Cursor() override = default;

        outcome::result<void> seekToFirst() override;

        outcome::result<void> seek( const Buffer &key ) override;

        outcome::result<void> seekToLast() override;

        bool isValid() const override;

        outcome::result<void> next() override;

        outcome::result<void> prev() override;

        outcome::result<Buffer> key() const override;

        outcome::result<Buffer> value() const override;

    private:
        std::map<Buffer, Buffer>                 snapshot_;
        std::map<Buffer, Buffer>::const_iterator it_;
    };
}

#endif // REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_CURSOR_HPP
