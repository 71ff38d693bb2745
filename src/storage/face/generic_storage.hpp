#ifndef REQKEEP_STORAGE_FACE_GENERIC_STORAGE_HPP
#define REQKEEP_STORAGE_FACE_GENERIC_STORAGE_HPP

#include <string>

#include "storage/face/generic_maps.hpp"

namespace reqkeep::storage::face
{
    /**
     * @brief An abstraction over readable, writeable, iterable key-value storage
     * that supports write batches
     * @tparam K key type
     * @tparam V value type
     */
    template <typename K, typename V>
    struct GenericStorage : public ReadOnlyMap<K, V>, public BatchWriteMap<K, V>
    {
        /**
         * @brief Backend name used in logs
         */
        virtual std::string GetName() const = 0;
    };
}

#endif // REQKEEP_STORAGE_FACE_GENERIC_STORAGE_HPP
