#include "jobs/serial_job_runner.hpp"

#include <exception>

#include "request/request_error.hpp"

namespace reqkeep::jobs
{
    SerialJobRunner::SerialJobRunner( Config config, std::shared_ptr<Checkpointer> checkpointer ) :
        config_( config ),
        checkpointer_( std::move( checkpointer ) ),
        work_( boost::asio::make_work_guard( io_ ) ),
        timer_( io_ )
    {
    }

    SerialJobRunner::~SerialJobRunner()
    {
        shutdown();
    }

    void SerialJobRunner::start( request::RequestContext ctx )
    {
        if ( !config_.enabled )
        {
            logger_->warn( "Persistence is disabled, durable jobs will be refused" );
            return;
        }
        if ( thread_.joinable() )
        {
            return;
        }
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            ctx_ = std::move( ctx );
        }
        scheduleCheckpointTimer();
        thread_ = std::thread( [this] { io_.run(); } );
        logger_->info( "Started, checkpoint every {} ms", config_.checkpoint_interval.count() );
    }

    void SerialJobRunner::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( !accepting_ )
            {
                return;
            }
            accepting_ = false;
        }

        if ( thread_.joinable() )
        {
            // Posted after every queued job, so it runs once they are drained
            boost::asio::post( io_,
                               [this]
                               {
                                   runCheckpoint( true );
                                   timer_.cancel();
                                   work_.reset();
                               } );
            thread_.join();
            logger_->info( "Stopped after {} checkpoints", checkpoints_.load() );
        }
        else
        {
            work_.reset();
        }

        std::lock_guard<std::mutex> lock( mutex_ );
        ctx_ = request::RequestContext{};
    }

    outcome::result<void> SerialJobRunner::submit( Job job, JobPriority priority )
    {
        if ( !config_.enabled )
        {
            return request::RequestError::PERSISTENCE_DISABLED;
        }
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( !accepting_ )
            {
                logger_->warn( "Refusing job while shutting down" );
                return request::RequestError::PERSISTENCE_DISABLED;
            }
            queue_.push( QueuedJob{ priority, next_sequence_++, std::move( job ) } );
        }
        boost::asio::post( io_, [this] { runNext(); } );
        return outcome::success();
    }

    void SerialJobRunner::requestCheckpointSoon()
    {
        if ( !config_.enabled || checkpoint_requested_.exchange( true ) )
        {
            return;
        }
        boost::asio::post( io_,
                           [this]
                           {
                               if ( checkpoint_requested_.exchange( false ) )
                               {
                                   runCheckpoint( false );
                               }
                           } );
    }

    void SerialJobRunner::runNext()
    {
        QueuedJob next{ JobPriority::LOW, 0, nullptr };
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( queue_.empty() )
            {
                return;
            }
            next = queue_.top();
            queue_.pop();
        }

        bool checkpoint = false;
        try
        {
            checkpoint = next.job( ctx_ );
        }
        catch ( const std::exception &e )
        {
            logger_->error( "Durable job failed: {}", e.what() );
        }

        if ( checkpoint || checkpoint_requested_.exchange( false ) )
        {
            runCheckpoint( false );
        }
    }

    void SerialJobRunner::runCheckpoint( bool final )
    {
        auto written = checkpointer_->checkpoint( final );
        if ( !written )
        {
            logger_->error( "Checkpoint failed: {}", written.error().message() );
        }
        ++checkpoints_;
    }

    void SerialJobRunner::scheduleCheckpointTimer()
    {
        timer_.expires_after( config_.checkpoint_interval );
        timer_.async_wait(
            [this]( const boost::system::error_code &ec )
            {
                if ( ec )
                {
                    return;
                }
                {
                    std::lock_guard<std::mutex> lock( mutex_ );
                    if ( !accepting_ )
                    {
                        return;
                    }
                }
                checkpoint_requested_ = false;
                runCheckpoint( false );
                scheduleCheckpointTimer();
            } );
    }
}
