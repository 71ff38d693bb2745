#ifndef REQKEEP_TEST_MOCK_JOBS_JOB_RUNNER_MOCK_HPP
#define REQKEEP_TEST_MOCK_JOBS_JOB_RUNNER_MOCK_HPP

#include <gmock/gmock.h>

#include "jobs/checkpointer.hpp"
#include "jobs/executor.hpp"
#include "jobs/persistent_job_runner.hpp"

namespace reqkeep::jobs
{
    class PersistentJobRunnerMock : public PersistentJobRunner
    {
    public:
        MOCK_METHOD2( submit, outcome::result<void>( Job, JobPriority ) );
        MOCK_METHOD0( requestCheckpointSoon, void() );
        MOCK_CONST_METHOD0( isEnabled, bool() );
    };

    class ExecutorMock : public Executor
    {
    public:
        MOCK_METHOD2( execute, void( std::function<void()>, const std::string & ) );
    };

    class CheckpointerMock : public Checkpointer
    {
    public:
        MOCK_METHOD1( checkpoint, outcome::result<void>( bool ) );
    };
}

#endif // REQKEEP_TEST_MOCK_JOBS_JOB_RUNNER_MOCK_HPP
