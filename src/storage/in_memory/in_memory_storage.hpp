#ifndef REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP
#define REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "base/buffer.hpp"
#include "outcome/outcome.hpp"
#include "storage/buffer_map_types.hpp"

namespace reqkeep::storage
{
    /**
     * Simple storage that conforms PersistentMap interface
     * Used by tests and by nodes configured without a database
     */
    class InMemoryStorage : public storage::BufferStorage
    {
    public:
        class Cursor;

        ~InMemoryStorage() override = default;

        outcome::result<base::Buffer> get( const base::Buffer &key ) const override;

        outcome::result<void> put( const base::Buffer &key, const base::Buffer &value ) override;

        outcome::result<void> put( const base::Buffer &key, base::Buffer &&value ) override;

        bool contains( const base::Buffer &key ) const override;

        bool empty() const override;

        outcome::result<void> remove( const base::Buffer &key ) override;

        std::unique_ptr<BufferBatch> batch() override;

        /**
         * @brief Cursor over a snapshot of the current contents
         */
        std::unique_ptr<BufferMapCursor> cursor() override;

        std::string GetName() const override
        {
            return "InMemoryStorage";
        }

        size_t size() const;

    private:
        friend class InMemoryBatch;

        mutable std::mutex                   mutex_;
        std::map<base::Buffer, base::Buffer> storage_;
    };
}

#endif // REQKEEP_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP
