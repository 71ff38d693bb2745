#ifndef REQKEEP_TEST_MOCK_STORAGE_PERSISTENT_MAP_MOCK_HPP
#define REQKEEP_TEST_MOCK_STORAGE_PERSISTENT_MAP_MOCK_HPP

#include <gmock/gmock.h>

#include "storage/face/generic_storage.hpp"
#include "storage/face/write_batch.hpp"

namespace reqkeep::storage::face
{
    template <typename K, typename V>
    struct GenericStorageMock : public face::GenericStorage<K, V>
    {
        MOCK_METHOD0_T( batch, std::unique_ptr<WriteBatch<K, V>>() );

        MOCK_METHOD0_T( cursor, std::unique_ptr<MapCursor<K, V>>() );

        MOCK_CONST_METHOD1_T( get, outcome::result<V>( const K & ) );

        MOCK_CONST_METHOD1_T( contains, bool( const K & ) );

        MOCK_CONST_METHOD0_T( empty, bool() );

        MOCK_METHOD2_T( put, outcome::result<void>( const K &, const V & ) );

        outcome::result<void> put( const K &k, V &&v ) override
        {
            return put_rv( k, std::move( v ) );
        }
        MOCK_METHOD2_T( put_rv, outcome::result<void>( const K &, V ) );

        MOCK_METHOD1_T( remove, outcome::result<void>( const K & ) );

        MOCK_CONST_METHOD0_T( GetName, std::string() );
    };

    template <typename K, typename V>
    struct WriteBatchMock : public face::WriteBatch<K, V>
    {
        MOCK_METHOD2_T( put, outcome::result<void>( const K &, const V & ) );

        outcome::result<void> put( const K &k, V &&v ) override
        {
            return put_rv( k, std::move( v ) );
        }
        MOCK_METHOD2_T( put_rv, outcome::result<void>( const K &, V ) );

        MOCK_METHOD1_T( remove, outcome::result<void>( const K & ) );

        MOCK_METHOD0_T( commit, outcome::result<void>() );

        MOCK_METHOD0_T( clear, void() );
    };
}

#endif // REQKEEP_TEST_MOCK_STORAGE_PERSISTENT_MAP_MOCK_HPP
