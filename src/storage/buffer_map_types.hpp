#ifndef REQKEEP_STORAGE_BUFFER_MAP_TYPES_HPP
#define REQKEEP_STORAGE_BUFFER_MAP_TYPES_HPP

/**
 * This file contains convenience typedefs for interfaces from face/, as they
 * are mostly used with Buffer key and value types
 */

#include "base/buffer.hpp"
#include "storage/face/batchable.hpp"
#include "storage/face/generic_storage.hpp"
#include "storage/face/write_batch.hpp"

namespace reqkeep::storage
{
    using Buffer = base::Buffer;

    using BufferBatch = face::WriteBatch<Buffer, Buffer>;

    using BufferStorage = face::GenericStorage<Buffer, Buffer>;

    using BufferMapCursor = face::MapCursor<Buffer, Buffer>;
}

#endif // REQKEEP_STORAGE_BUFFER_MAP_TYPES_HPP
