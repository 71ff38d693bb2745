#include "client/client_entry.hpp"

#include <algorithm>

#include "request/request_error.hpp"

namespace reqkeep::client
{
    using request::RequestError;

    ClientEntry::ClientEntry( bool                         shared,
                              boost::optional<std::string> name,
                              request::DurabilityTier      tier,
                              ClientLimits                 limits ) :
        shared_( shared ), name_( std::move( name ) ), tier_( tier ), limits_( limits )
    {
    }

    request::EngineBinding ClientEntry::lowLevelEngineFactory( bool realtime ) const
    {
        return { tier_ == request::DurabilityTier::CRASH_PERSISTENT, realtime };
    }

    outcome::result<void> ClientEntry::addRequest( const RecordPtr &record )
    {
        if ( record->tier() != tier_ )
        {
            return RequestError::TIER_MISMATCH;
        }
        auto status = RequestStatus::fromRecord( *record );

        std::lock_guard<std::mutex> lock( mutex_ );
        if ( !requests_.emplace( record->identity().identifier(), record ).second )
        {
            return RequestError::IDENTIFIER_COLLISION;
        }
        if ( status.finished )
        {
            finished_order_.push_back( status.identifier );
        }
        cache_.addRequest( std::move( status ) );
        return outcome::success();
    }

    outcome::result<void> ClientEntry::registerRequest( const RecordPtr &record )
    {
        OUTCOME_TRY( addRequest( record ) );
        requestStatusUpdated( record->identity() );
        return outcome::success();
    }

    outcome::result<void> ClientEntry::resumeRequest( const RecordPtr &record )
    {
        return addRequest( record );
    }

    ClientEntry::RecordPtr ClientEntry::getRequest( const std::string &identifier ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        it = requests_.find( identifier );
        return it == requests_.end() ? nullptr : it->second;
    }

    std::vector<ClientEntry::RecordPtr> ClientEntry::requests() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        std::vector<RecordPtr>      records;
        records.reserve( requests_.size() );
        for ( const auto &[identifier, record] : requests_ )
        {
            records.push_back( record );
        }
        return records;
    }

    std::vector<request::PersistentRequestTag> ClientEntry::persistentTags() const
    {
        std::vector<request::PersistentRequestTag> tags;
        for ( const auto &record : requests() )
        {
            tags.push_back( record->persistentTag() );
        }
        return tags;
    }

    outcome::result<void> ClientEntry::removeByIdentifier( const std::string &identifier, request::RequestContext &ctx )
    {
        auto record = getRequest( identifier );
        if ( !record )
        {
            return RequestError::REQUEST_NOT_FOUND;
        }
        record->cancel( ctx );
        return outcome::success();
    }

    outcome::result<void> ClientEntry::acknowledge( const std::string &identifier, request::RequestContext &ctx )
    {
        auto record = getRequest( identifier );
        if ( !record )
        {
            return RequestError::REQUEST_NOT_FOUND;
        }
        if ( !record->isFinished() )
        {
            return RequestError::NOT_FINISHED;
        }
        record->cancel( ctx );
        return outcome::success();
    }

    void ClientEntry::subscribe( const std::shared_ptr<RequestEventListener> &listener )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        listeners_.push_back( listener );
    }

    void ClientEntry::unsubscribe( const std::shared_ptr<RequestEventListener> &listener )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        listeners_.erase( std::remove_if( listeners_.begin(),
                                          listeners_.end(),
                                          [&listener]( const std::weak_ptr<RequestEventListener> &weak )
                                          {
                                              auto live = weak.lock();
                                              return !live || live == listener;
                                          } ),
                          listeners_.end() );
    }

    std::vector<std::shared_ptr<RequestEventListener>> ClientEntry::liveListeners() const
    {
        std::lock_guard<std::mutex>                        lock( mutex_ );
        std::vector<std::shared_ptr<RequestEventListener>> live;
        for ( const auto &weak : listeners_ )
        {
            if ( auto listener = weak.lock() )
            {
                live.push_back( std::move( listener ) );
            }
        }
        return live;
    }

    void ClientEntry::finishedClientRequest( const RecordPtr &record, request::RequestContext &ctx )
    {
        const auto            &identifier = record->identity().identifier();
        std::vector<RecordPtr> evicted;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            auto                        it = requests_.find( identifier );
            if ( it == requests_.end() || it->second != record )
            {
                return;
            }
            finished_order_.erase( std::remove( finished_order_.begin(), finished_order_.end(), identifier ),
                                   finished_order_.end() );
            finished_order_.push_back( identifier );
            while ( finished_order_.size() > limits_.max_unacknowledged_finished )
            {
                auto oldest = requests_.find( finished_order_.front() );
                finished_order_.pop_front();
                if ( oldest != requests_.end() && oldest->second->isFinished() )
                {
                    evicted.push_back( oldest->second );
                }
            }
        }

        auto tag = record->persistentTag();
        for ( const auto &listener : liveListeners() )
        {
            listener->onRequestFinished( tag );
        }
        for ( const auto &dropped : evicted )
        {
            logger_->info( "Too many unacknowledged finished requests, dropping {}", dropped->identity().toString() );
            dropped->dropped( ctx );
        }
    }

    void ClientEntry::requestRemoved( const RecordPtr &record )
    {
        const auto &identifier = record->identity().identifier();
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            auto                        it = requests_.find( identifier );
            if ( it == requests_.end() || it->second != record )
            {
                return;
            }
            requests_.erase( it );
            finished_order_.erase( std::remove( finished_order_.begin(), finished_order_.end(), identifier ),
                                   finished_order_.end() );
            cache_.remove( identifier );
        }

        for ( const auto &listener : liveListeners() )
        {
            listener->onRequestRemoved( record->identity() );
        }
    }

    void ClientEntry::requestModified( const request::PersistentRequestModified &modification )
    {
        for ( const auto &listener : liveListeners() )
        {
            listener->onRequestModified( modification );
        }
    }

    void ClientEntry::requestStatusUpdated( const request::RequestIdentity &identity )
    {
        auto status = cache_.get( identity.identifier() );
        if ( !status )
        {
            return;
        }
        for ( const auto &listener : liveListeners() )
        {
            listener->onStatusUpdated( *status );
        }
    }
}
