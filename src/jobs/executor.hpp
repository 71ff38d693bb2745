#ifndef REQKEEP_JOBS_EXECUTOR_HPP
#define REQKEEP_JOBS_EXECUTOR_HPP

#include <functional>
#include <string>

namespace reqkeep::jobs
{
    /**
     * Runs transient work that does not touch durable state
     */
    class Executor
    {
    public:
        virtual ~Executor() = default;

        /**
         * @param name - label used in logs
         */
        virtual void execute( std::function<void()> task, const std::string &name ) = 0;
    };
}

#endif // REQKEEP_JOBS_EXECUTOR_HPP
