#include "client/request_status_cache.hpp"

#include "request/request_record.hpp"

namespace reqkeep::client
{
    RequestStatus RequestStatus::fromRecord( const request::RequestRecord &record )
    {
        RequestStatus status{ record.identity().identifier(), record.kind(),          record.target(),
                              record.tier(),                  record.isRealTime(),    record.priorityClass(),
                              record.clientToken() };
        status.started         = record.isStarted();
        status.finished        = record.isFinished();
        status.succeeded       = record.hasSucceeded();
        status.failure_reason  = record.failureReason();
        status.completion_time = record.completionTime();
        return status;
    }

    void RequestStatusCache::addRequest( RequestStatus status )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        identifier = status.identifier;
        statuses_.insert_or_assign( identifier, std::move( status ) );
    }

    void RequestStatusCache::setPriority( const std::string &identifier, request::PriorityClass priority_class )
    {
        update( identifier, [priority_class]( RequestStatus &status ) { status.priority_class = priority_class; } );
    }

    void RequestStatusCache::updateStarted( const std::string &identifier, bool started )
    {
        update( identifier, [started]( RequestStatus &status ) { status.started = started; } );
    }

    void RequestStatusCache::updateClientToken( const std::string &identifier, const std::string &client_token )
    {
        update( identifier, [&client_token]( RequestStatus &status ) { status.client_token = client_token; } );
    }

    void RequestStatusCache::finished( const std::string                  &identifier,
                                       bool                                succeeded,
                                       const boost::optional<std::string> &failure_reason,
                                       int64_t                             completion_time )
    {
        update( identifier,
                [&]( RequestStatus &status )
                {
                    status.finished        = true;
                    status.succeeded       = succeeded;
                    status.failure_reason  = failure_reason;
                    status.completion_time = completion_time;
                } );
    }

    void RequestStatusCache::restarted( const std::string &identifier )
    {
        update( identifier,
                []( RequestStatus &status )
                {
                    status.finished        = false;
                    status.succeeded       = false;
                    status.failure_reason  = boost::none;
                    status.completion_time = 0;
                } );
    }

    void RequestStatusCache::remove( const std::string &identifier )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        statuses_.erase( identifier );
    }

    boost::optional<RequestStatus> RequestStatusCache::get( const std::string &identifier ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        it = statuses_.find( identifier );
        if ( it == statuses_.end() )
        {
            return boost::none;
        }
        return it->second;
    }

    std::vector<RequestStatus> RequestStatusCache::list() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        std::vector<RequestStatus>  statuses;
        statuses.reserve( statuses_.size() );
        for ( const auto &[identifier, status] : statuses_ )
        {
            statuses.push_back( status );
        }
        return statuses;
    }

    size_t RequestStatusCache::size() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return statuses_.size();
    }
}
