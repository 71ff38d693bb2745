#include "client/client_registry.hpp"

#include <gtest/gtest.h>

#include "request/request_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/request_fixture.hpp"

using namespace reqkeep;
using namespace reqkeep::request;

using ClientRegistryTest = test::RequestFixture;

/**
 * @given a registry
 * @when the same client is looked up twice
 * @then the same entry is returned
 */
TEST_F( ClientRegistryTest, LookupIsStable )
{
    EXPECT_OUTCOME_TRUE( first, persistent_root->lookupOrCreateClient( false, std::string( "alice" ) ) );
    EXPECT_OUTCOME_TRUE( second, persistent_root->lookupOrCreateClient( false, std::string( "alice" ) ) );
    EXPECT_OUTCOME_TRUE( shared, persistent_root->lookupOrCreateClient( true, boost::none ) );

    EXPECT_EQ( first, second );
    EXPECT_NE( first, shared );
    EXPECT_TRUE( shared->isShared() );
    EXPECT_EQ( first->tier(), DurabilityTier::CRASH_PERSISTENT );
    EXPECT_EQ( persistent_root->clients().size(), 2 );
}

/**
 * @given a shared flag together with a client name
 * @when a client is looked up
 * @then INVALID_IDENTITY is returned
 */
TEST_F( ClientRegistryTest, LookupRejectsInvalidIdentity )
{
    EXPECT_OUTCOME_ERROR( persistent_root->lookupOrCreateClient( true, std::string( "alice" ) ),
                          RequestError::INVALID_IDENTITY );
    EXPECT_OUTCOME_ERROR( persistent_root->lookupOrCreateClient( false, boost::none ),
                          RequestError::INVALID_IDENTITY );
}

/**
 * @given requests of several clients
 * @when they are searched by identity
 * @then only an exact identity match is found
 */
TEST_F( ClientRegistryTest, FindByIdentity )
{
    auto alice = persistentFetch( "alice", "download-1" );
    auto bob   = persistentFetch( "bob", "download-1" );

    EXPECT_EQ( persistent_root->find( alice->identity() ), alice );
    EXPECT_EQ( persistent_root->find( bob->identity() ), bob );
    EXPECT_EQ( persistent_root->find( RequestIdentity::forClient( "alice", "download-1", RequestKind::PUT ) ),
               nullptr );
    EXPECT_EQ( persistent_root->find( RequestIdentity::forClient( "carol", "download-1", RequestKind::GET ) ),
               nullptr );
    EXPECT_EQ( persistent_root->allRequests().size(), 2 );
}
