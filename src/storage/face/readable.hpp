#ifndef REQKEEP_STORAGE_FACE_READABLE_HPP
#define REQKEEP_STORAGE_FACE_READABLE_HPP

#include "outcome/outcome.hpp"

namespace reqkeep::storage::face
{
    /**
     * @brief A mixin for read-only map.
     * @tparam K key type
     * @tparam V value type
     */
    template <typename K, typename V>
    struct Readable
    {
        virtual ~Readable() = default;

        /**
         * @brief Get value by key
         * @param key K
         * @return V or DatabaseError::NOT_FOUND
         */
        virtual outcome::result<V> get( const K &key ) const = 0;

        /**
         * @brief Returns true if given key-value binding exists in the storage.
         * @param key K
         * @return true if key has value, false if does not, or error at .
         */
        virtual bool contains( const K &key ) const = 0;

        /**
         * @brief Returns true if the storage is empty.
         */
        virtual bool empty() const = 0;
    };
}

#endif // REQKEEP_STORAGE_FACE_READABLE_HPP
