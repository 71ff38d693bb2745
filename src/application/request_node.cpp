#include "application/request_node.hpp"

#include <algorithm>

#include "clock/impl/clock_impl.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"

namespace reqkeep::application
{
    outcome::result<std::unique_ptr<RequestNode>> RequestNode::create( const NodeConfig                       &config,
                                                                       std::shared_ptr<request::RequestEngine> engine,
                                                                       std::shared_ptr<storage::BufferStorage> backend,
                                                                       std::shared_ptr<clock::SystemClock>     system_clock )
    {
        base::configureLogging( config.logging );

        if ( !backend )
        {
            if ( config.storage_backend == NodeConfig::StorageBackend::MEMORY )
            {
                backend = std::make_shared<storage::InMemoryStorage>();
            }
            else
            {
                storage::rocksdb::Options options;
                options.create_if_missing = true;
                OUTCOME_TRY( auto db, storage::rocksdb::create( config.storage_path, options ) );
                backend = std::move( db );
            }
        }
        if ( !system_clock )
        {
            system_clock = std::make_shared<clock::SystemClockImpl>();
        }

        client::ClientLimits limits{ config.max_unacknowledged_finished };

        std::unique_ptr<RequestNode> node( new RequestNode() );
        node->storage_         = std::move( backend );
        node->persistent_root_ = std::make_shared<client::ClientRegistry>( request::DurabilityTier::CRASH_PERSISTENT,
                                                                           limits );
        node->reboot_root_     = std::make_shared<client::ClientRegistry>( request::DurabilityTier::REBOOT_PERSISTENT,
                                                                       limits );
        node->store_           = std::make_shared<persistence::RequestStore>( node->storage_, node->persistent_root_ );
        node->job_runner_      = std::make_shared<jobs::SerialJobRunner>(
            jobs::SerialJobRunner::Config{ config.persistence_enabled, config.checkpoint_interval }, node->store_ );
        node->executor_ = std::make_shared<jobs::AsioExecutor>( config.executor_threads );

        node->ctx_.job_runner      = node->job_runner_;
        node->ctx_.executor        = node->executor_;
        node->ctx_.persistent_root = node->persistent_root_;
        node->ctx_.engine          = std::move( engine );
        node->ctx_.clock           = std::move( system_clock );

        node->logger_->info( "Request node created on {} storage", node->storage_->GetName() );
        return node;
    }

    RequestNode::~RequestNode()
    {
        shutdown();
    }

    persistence::ResumeReport RequestNode::start()
    {
        persistence::ResumeReport report;
        if ( job_runner_->isEnabled() )
        {
            report = store_->resumeAll( ctx_ );
        }
        job_runner_->start( ctx_ );
        return report;
    }

    void RequestNode::shutdown()
    {
        std::vector<std::shared_ptr<client::ConnectionSession>> sessions;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( stopped_ )
            {
                return;
            }
            stopped_ = true;
            for ( const auto &weak : sessions_ )
            {
                if ( auto session = weak.lock() )
                {
                    sessions.push_back( std::move( session ) );
                }
            }
        }

        logger_->info( "Shutting down" );
        for ( const auto &session : sessions )
        {
            for ( const auto &record : session->requests() )
            {
                record->onShutdown( ctx_ );
            }
        }
        for ( const auto &record : reboot_root_->allRequests() )
        {
            record->onShutdown( ctx_ );
        }
        for ( const auto &record : persistent_root_->allRequests() )
        {
            record->onShutdown( ctx_ );
        }

        job_runner_->shutdown();
        executor_->join();
        logger_->info( "Stopped" );
    }

    std::shared_ptr<client::ConnectionSession> RequestNode::openSession(
        std::string                                   name,
        std::shared_ptr<client::RequestEventListener> listener )
    {
        auto session = std::make_shared<client::ConnectionSession>( std::move( name ), std::move( listener ) );

        std::lock_guard<std::mutex> lock( mutex_ );
        sessions_.erase( std::remove_if( sessions_.begin(),
                                         sessions_.end(),
                                         []( const std::weak_ptr<client::ConnectionSession> &weak )
                                         { return weak.expired(); } ),
                         sessions_.end() );
        sessions_.push_back( session );
        return session;
    }
}
