#include "client/client_entry.hpp"

#include <gtest/gtest.h>

#include "mock/src/client/request_event_listener_mock.hpp"
#include "request/request_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/request_fixture.hpp"

using namespace reqkeep;
using namespace reqkeep::request;
using reqkeep::client::ClientEntry;
using reqkeep::client::ClientLimits;
using reqkeep::client::RequestEventListenerMock;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::StrictMock;

class ClientEntryTest : public test::RequestFixture
{
public:
    void SetUp() override
    {
        RequestFixture::SetUp();
        ClientLimits limits;
        limits.max_unacknowledged_finished = 2;
        persistent_root = std::make_shared<client::ClientRegistry>( DurabilityTier::CRASH_PERSISTENT, limits );
        ctx.persistent_root = persistent_root;

        client   = persistent_root->lookupOrCreateClient( false, std::string( "alice" ) ).value();
        listener = std::make_shared<NiceMock<RequestEventListenerMock>>();
        client->subscribe( listener );
    }

    RequestRecord::Ptr finishedFetch( const std::string &identifier )
    {
        auto record = persistentFetch( "alice", identifier );
        record->onSuccess( ctx );
        return record;
    }

    std::shared_ptr<ClientEntry>                        client;
    std::shared_ptr<NiceMock<RequestEventListenerMock>> listener;
};

/**
 * @given a client limited to two unacknowledged finished requests
 * @when a third request finishes
 * @then the oldest finished request is dropped and its removal announced
 */
TEST_F( ClientEntryTest, DropsOldestUnacknowledged )
{
    auto first  = finishedFetch( "first" );
    auto second = finishedFetch( "second" );
    auto running = persistentFetch( "alice", "running" );

    EXPECT_CALL( *listener, onRequestRemoved( first->identity() ) ).Times( 1 );
    EXPECT_CALL( *requesters["first"], cancel( _ ) ).Times( 1 );
    auto third = finishedFetch( "third" );

    EXPECT_TRUE( first->isCancelled() );
    EXPECT_EQ( client->getRequest( "first" ), nullptr );
    EXPECT_EQ( client->getRequest( "second" ), second );
    EXPECT_EQ( client->getRequest( "third" ), third );
    EXPECT_EQ( client->getRequest( "running" ), running );
    EXPECT_EQ( client->statusCache().size(), 3 );
}

/**
 * @given finished and running requests
 * @when they are acknowledged
 * @then only finished ones are removed
 */
TEST_F( ClientEntryTest, Acknowledge )
{
    auto done    = finishedFetch( "done" );
    auto running = persistentFetch( "alice", "running" );

    EXPECT_CALL( *listener, onRequestRemoved( done->identity() ) ).Times( 1 );
    EXPECT_OUTCOME_TRUE_1( client->acknowledge( "done", ctx ) );
    EXPECT_OUTCOME_ERROR( client->acknowledge( "running", ctx ), RequestError::NOT_FINISHED );
    EXPECT_OUTCOME_ERROR( client->acknowledge( "missing", ctx ), RequestError::REQUEST_NOT_FOUND );

    EXPECT_EQ( client->getRequest( "done" ), nullptr );
    EXPECT_EQ( client->getRequest( "running" ), running );
}

/**
 * @given a running request
 * @when it is removed by identifier
 * @then it is cancelled and removed
 */
TEST_F( ClientEntryTest, RemoveByIdentifier )
{
    auto running = persistentFetch( "alice", "running" );
    EXPECT_CALL( *requesters["running"], cancel( _ ) ).Times( 1 );

    EXPECT_OUTCOME_TRUE_1( client->removeByIdentifier( "running", ctx ) );
    EXPECT_OUTCOME_ERROR( client->removeByIdentifier( "running", ctx ), RequestError::REQUEST_NOT_FOUND );
    EXPECT_TRUE( running->isCancelled() );
}

/**
 * @given requests of a client
 * @when the client lists them
 * @then each tag carries its kind specific fields
 */
TEST_F( ClientEntryTest, PersistentTags )
{
    persistentFetch( "alice", "a" );
    persistentFetch( "alice", "b" );

    auto tags = client->persistentTags();
    ASSERT_EQ( tags.size(), 2 );
    for ( const auto &tag : tags )
    {
        EXPECT_EQ( tag.tier, DurabilityTier::CRASH_PERSISTENT );
        EXPECT_TRUE( tag.max_size );
        EXPECT_FALSE( tag.data_length );
    }
}

/**
 * @given a listener that unsubscribed and one that went away
 * @when a request finishes
 * @then neither is called
 */
TEST_F( ClientEntryTest, Unsubscribe )
{
    auto gone = std::make_shared<StrictMock<RequestEventListenerMock>>();
    client->subscribe( gone );
    gone.reset();
    client->unsubscribe( listener );

    EXPECT_CALL( *listener, onRequestFinished( _ ) ).Times( 0 );
    finishedFetch( "done" );
}

/**
 * @given a request of a reboot persistent client
 * @when it is registered with a crash persistent client
 * @then TIER_MISMATCH is returned
 */
TEST_F( ClientEntryTest, RegisterRejectsOtherTier )
{
    auto reboot_client = reboot_root->lookupOrCreateClient( false, std::string( "alice" ) ).value();
    EXPECT_OUTCOME_TRUE(
        record,
        RequestRecord::createForClient( ctx,
                                        params( RequestIdentity::forClient( "alice", "r", RequestKind::GET ),
                                                DurabilityTier::REBOOT_PERSISTENT ),
                                        reboot_client,
                                        fetch() ) );

    EXPECT_OUTCOME_ERROR( client->registerRequest( record ), RequestError::TIER_MISMATCH );
}
