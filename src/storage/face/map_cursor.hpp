#ifndef REQKEEP_STORAGE_FACE_MAP_CURSOR_HPP
#define REQKEEP_STORAGE_FACE_MAP_CURSOR_HPP

#include "outcome/outcome.hpp"

namespace reqkeep::storage::face
{
    /**
     * @brief An abstraction over generic map cursor.
     * @tparam K key type
     * @tparam V value type
     */
    template <typename K, typename V>
    struct MapCursor
    {
        virtual ~MapCursor() = default;

        /**
         * @brief Same as std::begin(...);
         */
        virtual outcome::result<void> seekToFirst() = 0;

        /**
         * @brief Find given key and seek iterator to this key.
         * Positions at the first key not less than the given one.
         */
        virtual outcome::result<void> seek( const K &key ) = 0;

        /**
         * @brief Same as std::rbegin(...);, e.g. points to the last valid
         * element
         */
        virtual outcome::result<void> seekToLast() = 0;

        /**
         * @brief Is the cursor in a valid state?
         */
        virtual bool isValid() const = 0;

        /**
         * @brief Make step forward.
         */
        virtual outcome::result<void> next() = 0;

        /**
         * @brief Make step back.
         */
        virtual outcome::result<void> prev() = 0;

        /**
         * @brief Getter for key.
         */
        virtual outcome::result<K> key() const = 0;

        /**
         * @brief Getter for value.
         */
        virtual outcome::result<V> value() const = 0;
    };
}

#endif // REQKEEP_STORAGE_FACE_MAP_CURSOR_HPP
