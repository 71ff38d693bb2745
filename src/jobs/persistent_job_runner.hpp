#ifndef REQKEEP_JOBS_PERSISTENT_JOB_RUNNER_HPP
#define REQKEEP_JOBS_PERSISTENT_JOB_RUNNER_HPP

#include <functional>

#include "outcome/outcome.hpp"

namespace reqkeep::request
{
    struct RequestContext;
}

namespace reqkeep::jobs
{
    enum class JobPriority
    {
        LOW    = 0,
        NORMAL = 1,
        HIGH   = 2,
    };

    /**
     * Runs jobs that change durable state, one at a time, and schedules
     * checkpoints of that state
     */
    class PersistentJobRunner
    {
    public:
        /**
         * Job body. Returns true if a checkpoint should follow the job.
         */
        using Job = std::function<bool( request::RequestContext & )>;

        virtual ~PersistentJobRunner() = default;

        /**
         * @return PERSISTENCE_DISABLED if the runner does not accept jobs,
         * e.g. while it is draining for shutdown
         */
        virtual outcome::result<void> submit( Job job, JobPriority priority ) = 0;

        /**
         * @brief Asks for a checkpoint as soon as possible. Requests made before
         * the checkpoint runs are coalesced.
         */
        virtual void requestCheckpointSoon() = 0;

        virtual bool isEnabled() const = 0;
    };
}

#endif // REQKEEP_JOBS_PERSISTENT_JOB_RUNNER_HPP
