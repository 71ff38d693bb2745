#include "client/request_status_cache.hpp"

#include <gtest/gtest.h>

using namespace reqkeep;
using namespace reqkeep::client;

namespace
{
    RequestStatus makeStatus( const std::string &identifier )
    {
        return RequestStatus{ identifier,
                              request::RequestKind::GET,
                              "CHK@target",
                              request::DurabilityTier::CRASH_PERSISTENT,
                              false,
                              request::priority::kBulkSplitfile,
                              boost::none };
    }
}

/**
 * @given a cached status
 * @when the request finishes and then restarts
 * @then the finish fields are set and then cleared
 */
TEST( RequestStatusCacheTest, FinishAndRestart )
{
    RequestStatusCache cache;
    cache.addRequest( makeStatus( "a" ) );

    cache.updateStarted( "a", true );
    cache.finished( "a", false, std::string( "timeout" ), 77 );
    auto finished = cache.get( "a" );
    ASSERT_TRUE( finished );
    EXPECT_TRUE( finished->started );
    EXPECT_TRUE( finished->finished );
    EXPECT_FALSE( finished->succeeded );
    EXPECT_EQ( *finished->failure_reason, "timeout" );
    EXPECT_EQ( finished->completion_time, 77 );

    cache.restarted( "a" );
    auto restarted = cache.get( "a" );
    ASSERT_TRUE( restarted );
    EXPECT_FALSE( restarted->finished );
    EXPECT_FALSE( restarted->failure_reason );
    EXPECT_EQ( restarted->completion_time, 0 );
}

/**
 * @given a cache
 * @when an unknown identifier is updated
 * @then nothing is added
 */
TEST( RequestStatusCacheTest, IgnoresUnknown )
{
    RequestStatusCache cache;
    cache.setPriority( "missing", request::priority::kMaximum );
    cache.updateClientToken( "missing", "token" );

    EXPECT_EQ( cache.size(), 0 );
    EXPECT_FALSE( cache.get( "missing" ) );
}

/**
 * @given two cached statuses
 * @when one is removed
 * @then the listing holds the other
 */
TEST( RequestStatusCacheTest, Remove )
{
    RequestStatusCache cache;
    cache.addRequest( makeStatus( "a" ) );
    cache.addRequest( makeStatus( "b" ) );
    cache.remove( "a" );

    auto list = cache.list();
    ASSERT_EQ( list.size(), 1 );
    EXPECT_EQ( list[0].identifier, "b" );
}
