#ifndef REQKEEP_STORAGE_FACE_WRITE_BATCH_HPP
#define REQKEEP_STORAGE_FACE_WRITE_BATCH_HPP

#include "storage/face/writeable.hpp"

namespace reqkeep::storage::face
{
    /**
     * @brief An abstraction over a storage, which can be used for batch writes.
     * Nothing is written before commit(), then everything is written at once.
     * @tparam K key type
     * @tparam V value type
     */
    template <typename K, typename V>
    struct WriteBatch : public Writeable<K, V>
    {
        /**
         * @brief Writes batch.
         * @return error code in case of error.
         */
        virtual outcome::result<void> commit() = 0;

        /**
         * @brief Clear batch.
         */
        virtual void clear() = 0;
    };
}

#endif // REQKEEP_STORAGE_FACE_WRITE_BATCH_HPP
