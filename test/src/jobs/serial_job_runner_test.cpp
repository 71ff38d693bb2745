#include "jobs/serial_job_runner.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "mock/src/jobs/job_runner_mock.hpp"
#include "request/request_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/wait_condition.hpp"

using namespace reqkeep;
using namespace reqkeep::jobs;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class SerialJobRunnerTest : public ::testing::Test
{
public:
    void SetUp() override
    {
        checkpointer = std::make_shared<NiceMock<CheckpointerMock>>();
        ON_CALL( *checkpointer, checkpoint( _ ) )
            .WillByDefault( Invoke(
                [this]( bool final ) -> outcome::result<void>
                {
                    record( final ? "final checkpoint" : "checkpoint" );
                    return outcome::success();
                } ) );
    }

    std::unique_ptr<SerialJobRunner> makeRunner( bool enabled = true, std::chrono::milliseconds interval = std::chrono::hours( 1 ) )
    {
        SerialJobRunner::Config config;
        config.enabled             = enabled;
        config.checkpoint_interval = interval;
        return std::make_unique<SerialJobRunner>( config, checkpointer );
    }

    PersistentJobRunner::Job job( std::string name, bool checkpoint = false )
    {
        return [this, name, checkpoint]( request::RequestContext & )
        {
            record( name );
            return checkpoint;
        };
    }

    void record( const std::string &event )
    {
        std::lock_guard<std::mutex> lock( mutex );
        events.push_back( event );
    }

    std::vector<std::string> recorded()
    {
        std::lock_guard<std::mutex> lock( mutex );
        return events;
    }

    std::shared_ptr<NiceMock<CheckpointerMock>> checkpointer;
    std::mutex                                  mutex;
    std::vector<std::string>                    events;
};

/**
 * @given jobs of every priority queued before the runner starts
 * @when the runner starts and shuts down
 * @then jobs run by priority, in submission order within a priority, before the final checkpoint
 */
TEST_F( SerialJobRunnerTest, RunsByPriorityThenDrains )
{
    auto runner = makeRunner();
    EXPECT_OUTCOME_TRUE_1( runner->submit( job( "low" ), JobPriority::LOW ) );
    EXPECT_OUTCOME_TRUE_1( runner->submit( job( "normal-1" ), JobPriority::NORMAL ) );
    EXPECT_OUTCOME_TRUE_1( runner->submit( job( "high" ), JobPriority::HIGH ) );
    EXPECT_OUTCOME_TRUE_1( runner->submit( job( "normal-2" ), JobPriority::NORMAL ) );

    runner->start( request::RequestContext{} );
    runner->shutdown();

    std::vector<std::string> expected{ "high", "normal-1", "normal-2", "low", "final checkpoint" };
    EXPECT_EQ( recorded(), expected );
}

/**
 * @given a runner that is shutting down
 * @when a job is submitted
 * @then PERSISTENCE_DISABLED is returned and the job never runs
 */
TEST_F( SerialJobRunnerTest, RefusesAfterShutdown )
{
    auto runner = makeRunner();
    runner->start( request::RequestContext{} );
    runner->shutdown();

    EXPECT_OUTCOME_ERROR( runner->submit( job( "late" ), JobPriority::HIGH ), request::RequestError::PERSISTENCE_DISABLED );
    std::vector<std::string> expected{ "final checkpoint" };
    EXPECT_EQ( recorded(), expected );
}

/**
 * @given a runner with persistence disabled
 * @when a job is submitted
 * @then PERSISTENCE_DISABLED is returned and no checkpoint is ever taken
 */
TEST_F( SerialJobRunnerTest, DisabledRefusesJobs )
{
    EXPECT_CALL( *checkpointer, checkpoint( _ ) ).Times( 0 );
    auto runner = makeRunner( false );
    EXPECT_FALSE( runner->isEnabled() );
    runner->start( request::RequestContext{} );

    EXPECT_OUTCOME_ERROR( runner->submit( job( "job" ), JobPriority::NORMAL ), request::RequestError::PERSISTENCE_DISABLED );
    runner->requestCheckpointSoon();
    runner->shutdown();
    EXPECT_TRUE( recorded().empty() );
}

/**
 * @given several checkpoint requests before the runner starts
 * @when it runs
 * @then they are coalesced into one checkpoint
 */
TEST_F( SerialJobRunnerTest, CoalescesCheckpointRequests )
{
    auto runner = makeRunner();
    runner->requestCheckpointSoon();
    runner->requestCheckpointSoon();
    runner->requestCheckpointSoon();

    runner->start( request::RequestContext{} );
    runner->shutdown();

    std::vector<std::string> expected{ "checkpoint", "final checkpoint" };
    EXPECT_EQ( recorded(), expected );
    EXPECT_EQ( runner->checkpointCount(), 2 );
}

/**
 * @given a job asking for a checkpoint and a job that throws
 * @when they run
 * @then a checkpoint follows the first and the runner survives the second
 */
TEST_F( SerialJobRunnerTest, JobResultDrivesCheckpoint )
{
    auto runner = makeRunner();
    EXPECT_OUTCOME_TRUE_1( runner->submit( job( "restart", true ), JobPriority::HIGH ) );
    EXPECT_OUTCOME_TRUE_1( runner->submit(
        []( request::RequestContext & ) -> bool { throw std::runtime_error( "engine exploded" ); },
        JobPriority::NORMAL ) );
    EXPECT_OUTCOME_TRUE_1( runner->submit( job( "after" ), JobPriority::LOW ) );

    runner->start( request::RequestContext{} );
    runner->shutdown();

    std::vector<std::string> expected{ "restart", "checkpoint", "after", "final checkpoint" };
    EXPECT_EQ( recorded(), expected );
}

/**
 * @given a short checkpoint interval
 * @when the runner is left alone
 * @then checkpoints are taken periodically
 */
TEST_F( SerialJobRunnerTest, PeriodicCheckpoint )
{
    auto runner = makeRunner( true, std::chrono::milliseconds( 20 ) );
    runner->start( request::RequestContext{} );

    ASSERT_WAIT_FOR_CONDITION( [&runner] { return runner->checkpointCount() >= 2; },
                               std::chrono::milliseconds( 2000 ),
                               "periodic checkpoints" );
    runner->shutdown();
}
