#include "persistence/request_store.hpp"

#include <gtest/gtest.h>
#include <boost/optional/optional_io.hpp>

#include "testutil/outcome.hpp"
#include "testutil/request_fixture.hpp"
#include "testutil/storage/temp_rocksdb.hpp"

using namespace reqkeep;
using namespace reqkeep::request;
using reqkeep::persistence::RequestStore;

class RequestStoreRocksDBTest : public reqkeep::test::RequestFixture
{
public:
    /// Fresh registry and store over the reopened database, as after a crash
    std::shared_ptr<RequestStore> restartNode()
    {
        persistent_root     = std::make_shared<client::ClientRegistry>( DurabilityTier::CRASH_PERSISTENT,
                                                                    client::ClientLimits{} );
        ctx.persistent_root = persistent_root;
        auto db             = database.reopen();
        EXPECT_TRUE( db ) << db.error().message();
        return std::make_shared<RequestStore>( db.value(), persistent_root );
    }

    reqkeep::test::TempRocksDB database{ "reqkeep_request_store_test" };
};

/**
 * @given persistent requests checkpointed into a database that is then closed
 * @when the database is reopened by a fresh registry
 * @then every request is resumed
 */
TEST_F( RequestStoreRocksDBTest, RequestsSurviveReopen )
{
    auto first  = persistentFetch( "alice", "download-1" );
    auto second = persistentFetch( "alice", "download-2" );
    second->onFailure( "route not found", ctx );
    {
        EXPECT_OUTCOME_TRUE( db, database.open() );
        RequestStore store( db, persistent_root );
        EXPECT_OUTCOME_TRUE_1( store.checkpoint( true ) );
    }

    auto store  = restartNode();
    auto report = store->resumeAll( ctx );

    EXPECT_EQ( report.resumed, 2u );
    EXPECT_EQ( report.failed, 0u );
    auto resumed = persistent_root->find( second->identity() );
    ASSERT_TRUE( resumed );
    EXPECT_TRUE( resumed->isFinished() );
    EXPECT_FALSE( resumed->hasSucceeded() );
    EXPECT_EQ( resumed->failureReason(), boost::make_optional( std::string( "route not found" ) ) );
    EXPECT_TRUE( resumed->fullyResumed() );
    EXPECT_TRUE( persistent_root->find( first->identity() ) );
}

/**
 * @given a resumed request that the client acknowledges after the restart
 * @when a checkpoint is taken and the database is reopened once more
 * @then only the request still live is resumed
 */
TEST_F( RequestStoreRocksDBTest, AcknowledgedRequestIsGoneAfterSecondRestart )
{
    auto kept = persistentFetch( "alice", "download-1" );
    auto done = persistentFetch( "alice", "download-2" );
    done->onSuccess( ctx );
    {
        EXPECT_OUTCOME_TRUE( db, database.open() );
        RequestStore store( db, persistent_root );
        EXPECT_OUTCOME_TRUE_1( store.checkpoint( true ) );
    }

    {
        auto store = restartNode();
        EXPECT_EQ( store->resumeAll( ctx ).resumed, 2u );
        auto client = persistent_root->getClient( false, std::string( "alice" ) );
        ASSERT_TRUE( client );
        EXPECT_OUTCOME_TRUE_1( client->acknowledge( "download-2", ctx ) );
        EXPECT_OUTCOME_TRUE_1( store->checkpoint( true ) );
    }

    auto store  = restartNode();
    auto report = store->resumeAll( ctx );

    EXPECT_EQ( report.resumed, 1u );
    EXPECT_TRUE( persistent_root->find( kept->identity() ) );
    EXPECT_FALSE( persistent_root->find( done->identity() ) );
}
