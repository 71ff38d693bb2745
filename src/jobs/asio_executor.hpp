#ifndef REQKEEP_JOBS_ASIO_EXECUTOR_HPP
#define REQKEEP_JOBS_ASIO_EXECUTOR_HPP

#include <atomic>
#include <cstddef>

#include <boost/asio/thread_pool.hpp>

#include "base/logger.hpp"
#include "jobs/executor.hpp"

namespace reqkeep::jobs
{
    /**
     * Executor backed by a boost::asio::thread_pool
     */
    class AsioExecutor : public Executor
    {
    public:
        explicit AsioExecutor( size_t threads );

        ~AsioExecutor() override;

        void execute( std::function<void()> task, const std::string &name ) override;

        /**
         * @brief Waits for queued tasks and stops the threads. Tasks executed
         * afterwards are dropped.
         */
        void join();

    private:
        boost::asio::thread_pool pool_;
        std::atomic<bool>        joined_{ false };

        base::Logger logger_ = base::createLogger( "AsioExecutor" );
    };
}

#endif // REQKEEP_JOBS_ASIO_EXECUTOR_HPP
