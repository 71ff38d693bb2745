#ifndef REQKEEP_TEST_MOCK_REQUEST_DATA_BUCKET_MOCK_HPP
#define REQKEEP_TEST_MOCK_REQUEST_DATA_BUCKET_MOCK_HPP

#include <gmock/gmock.h>

#include "request/data_bucket.hpp"

namespace reqkeep::request
{
    class DataBucketMock : public DataBucket
    {
    public:
        MOCK_CONST_METHOD0( size, uint64_t() );
        MOCK_METHOD0( free, void() );
    };
}

#endif // REQKEEP_TEST_MOCK_REQUEST_DATA_BUCKET_MOCK_HPP
