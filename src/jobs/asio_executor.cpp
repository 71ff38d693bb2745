#include "jobs/asio_executor.hpp"

#include <exception>

#include <boost/asio/post.hpp>

namespace reqkeep::jobs
{
    AsioExecutor::AsioExecutor( size_t threads ) : pool_( threads )
    {
    }

    AsioExecutor::~AsioExecutor()
    {
        join();
    }

    void AsioExecutor::execute( std::function<void()> task, const std::string &name )
    {
        if ( joined_ )
        {
            logger_->warn( "Executor stopped, dropping task {}", name );
            return;
        }
        boost::asio::post( pool_,
                           [task = std::move( task ), name, logger = logger_]
                           {
                               try
                               {
                                   task();
                               }
                               catch ( const std::exception &e )
                               {
                                   logger->error( "Task {} failed: {}", name, e.what() );
                               }
                           } );
    }

    void AsioExecutor::join()
    {
        if ( joined_.exchange( true ) )
        {
            return;
        }
        pool_.join();
    }
}
