#ifndef REQKEEP_JOBS_SERIAL_JOB_RUNNER_HPP
#define REQKEEP_JOBS_SERIAL_JOB_RUNNER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "base/logger.hpp"
#include "jobs/checkpointer.hpp"
#include "jobs/persistent_job_runner.hpp"
#include "request/request_context.hpp"

namespace reqkeep::jobs
{
    /**
     * @brief Runs durable jobs strictly one at a time on a dedicated
     * io_context thread, highest priority first and in submission order
     * within a priority. Checkpoints run on the same thread: periodically,
     * on request, after jobs that ask for one and once more at shutdown.
     */
    class SerialJobRunner : public PersistentJobRunner
    {
    public:
        struct Config
        {
            bool                      enabled = true;
            std::chrono::milliseconds checkpoint_interval{ 600000 };
        };

        SerialJobRunner( Config config, std::shared_ptr<Checkpointer> checkpointer );

        ~SerialJobRunner() override;

        /**
         * @brief Starts the worker thread. Jobs are run with the given
         * context.
         */
        void start( request::RequestContext ctx );

        /**
         * @brief Stops accepting jobs, runs the queued ones and a final
         * checkpoint, then joins the worker thread
         */
        void shutdown();

        outcome::result<void> submit( Job job, JobPriority priority ) override;

        void requestCheckpointSoon() override;

        bool isEnabled() const override
        {
            return config_.enabled;
        }

        /// Number of checkpoints run so far
        size_t checkpointCount() const
        {
            return checkpoints_;
        }

    private:
        struct QueuedJob
        {
            JobPriority priority;
            uint64_t    sequence;
            Job         job;
        };

        struct LowerPriority
        {
            bool operator()( const QueuedJob &lhs, const QueuedJob &rhs ) const
            {
                if ( lhs.priority != rhs.priority )
                {
                    return lhs.priority < rhs.priority;
                }
                return lhs.sequence > rhs.sequence;
            }
        };

        void runNext();

        void runCheckpoint( bool final );

        void scheduleCheckpointTimer();

        const Config                        config_;
        const std::shared_ptr<Checkpointer> checkpointer_;

        boost::asio::io_context                                                  io_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
        boost::asio::steady_timer                                                timer_;
        std::thread                                                              thread_;

        std::mutex                                                            mutex_;
        std::priority_queue<QueuedJob, std::vector<QueuedJob>, LowerPriority> queue_;
        uint64_t                                                              next_sequence_ = 0;
        bool                                                                  accepting_     = true;
        request::RequestContext                                               ctx_;

        std::atomic<bool>   checkpoint_requested_{ false };
        std::atomic<size_t> checkpoints_{ 0 };

        base::Logger logger_ = base::createLogger( "SerialJobRunner" );
    };
}

#endif // REQKEEP_JOBS_SERIAL_JOB_RUNNER_HPP
