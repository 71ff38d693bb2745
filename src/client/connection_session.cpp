#include "client/connection_session.hpp"

#include "request/request_error.hpp"

namespace reqkeep::client
{
    ConnectionSession::ConnectionSession( std::string name, std::shared_ptr<RequestEventListener> listener ) :
        name_( std::move( name ) ), listener_( std::move( listener ) )
    {
    }

    outcome::result<void> ConnectionSession::registerRequest( const RecordPtr &record )
    {
        if ( record->tier() != request::DurabilityTier::CONNECTION_SCOPED )
        {
            return request::RequestError::TIER_MISMATCH;
        }
        auto status = RequestStatus::fromRecord( *record );
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( !requests_.emplace( record->identity().identifier(), record ).second )
            {
                return request::RequestError::IDENTIFIER_COLLISION;
            }
            cache_.addRequest( std::move( status ) );
        }
        requestStatusUpdated( record->identity() );
        return outcome::success();
    }

    ConnectionSession::RecordPtr ConnectionSession::getRequest( const std::string &identifier ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        it = requests_.find( identifier );
        return it == requests_.end() ? nullptr : it->second;
    }

    std::vector<ConnectionSession::RecordPtr> ConnectionSession::requests() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        std::vector<RecordPtr>      records;
        for ( const auto &[identifier, record] : requests_ )
        {
            records.push_back( record );
        }
        return records;
    }

    outcome::result<void> ConnectionSession::removeByIdentifier( const std::string       &identifier,
                                                                 request::RequestContext &ctx )
    {
        auto record = getRequest( identifier );
        if ( !record )
        {
            return request::RequestError::REQUEST_NOT_FOUND;
        }
        record->cancel( ctx );
        return outcome::success();
    }

    void ConnectionSession::onLostConnection( request::RequestContext &ctx )
    {
        auto records = requests();
        logger_->debug( "Connection of {} lost, cancelling {} requests", name_, records.size() );
        for ( const auto &record : records )
        {
            record->cancel( ctx );
        }
    }

    bool ConnectionSession::erase( const RecordPtr &record )
    {
        const auto                 &identifier = record->identity().identifier();
        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        it = requests_.find( identifier );
        if ( it == requests_.end() || it->second != record )
        {
            return false;
        }
        requests_.erase( it );
        cache_.remove( identifier );
        return true;
    }

    void ConnectionSession::finishedClientRequest( const RecordPtr &record, request::RequestContext &ctx )
    {
        // Non-persistent requests are gone once the client has been told
        auto tag = record->persistentTag();
        if ( !erase( record ) )
        {
            return;
        }
        if ( listener_ )
        {
            listener_->onRequestFinished( tag );
        }
        record->freeData();
    }

    void ConnectionSession::requestRemoved( const RecordPtr &record )
    {
        if ( erase( record ) && listener_ )
        {
            listener_->onRequestRemoved( record->identity() );
        }
    }

    void ConnectionSession::requestModified( const request::PersistentRequestModified &modification )
    {
        if ( listener_ )
        {
            listener_->onRequestModified( modification );
        }
    }

    void ConnectionSession::requestStatusUpdated( const request::RequestIdentity &identity )
    {
        if ( !listener_ )
        {
            return;
        }
        if ( auto status = cache_.get( identity.identifier() ) )
        {
            listener_->onStatusUpdated( *status );
        }
    }
}
