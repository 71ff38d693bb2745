#ifndef REQKEEP_REQUEST_DATA_BUCKET_HPP
#define REQKEEP_REQUEST_DATA_BUCKET_HPP

#include <cstdint>
#include <mutex>

#include "base/buffer.hpp"

namespace reqkeep::request
{
    /**
     * Payload buffer held by a request, e.g. fetched data waiting for the
     * client or data queued for insert
     */
    class DataBucket
    {
    public:
        virtual ~DataBucket() = default;

        virtual uint64_t size() const = 0;

        /**
         * @brief Releases the payload
         */
        virtual void free() = 0;
    };

    /// Bucket kept in memory
    class ArrayBucket : public DataBucket
    {
    public:
        explicit ArrayBucket( base::Buffer data ) : data_( std::move( data ) )
        {
        }

        uint64_t size() const override
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            return data_.size();
        }

        void free() override
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            data_.clear();
        }

        base::Buffer data() const
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            return data_;
        }

    private:
        mutable std::mutex mutex_;
        base::Buffer       data_;
    };
}

#endif // REQKEEP_REQUEST_DATA_BUCKET_HPP
