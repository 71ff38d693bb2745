#include "client/client_registry.hpp"

#include "request/request_error.hpp"

namespace reqkeep::client
{
    ClientRegistry::ClientRegistry( request::DurabilityTier tier, ClientLimits limits ) : tier_( tier ), limits_( limits )
    {
    }

    outcome::result<std::shared_ptr<ClientEntry>> ClientRegistry::lookupOrCreateClient(
        bool                                shared,
        const boost::optional<std::string> &name )
    {
        if ( shared == name.has_value() )
        {
            return request::RequestError::INVALID_IDENTITY;
        }

        std::lock_guard<std::mutex> lock( mutex_ );
        if ( shared )
        {
            if ( !shared_queue_ )
            {
                shared_queue_ = std::make_shared<ClientEntry>( true, boost::none, tier_, limits_ );
            }
            return shared_queue_;
        }

        auto &entry = clients_[*name];
        if ( !entry )
        {
            entry = std::make_shared<ClientEntry>( false, name, tier_, limits_ );
        }
        return entry;
    }

    std::shared_ptr<ClientEntry> ClientRegistry::getClient( bool shared, const boost::optional<std::string> &name ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        if ( shared )
        {
            return shared_queue_;
        }
        if ( !name )
        {
            return nullptr;
        }
        auto it = clients_.find( *name );
        return it == clients_.end() ? nullptr : it->second;
    }

    std::vector<std::shared_ptr<ClientEntry>> ClientRegistry::clients() const
    {
        std::lock_guard<std::mutex>               lock( mutex_ );
        std::vector<std::shared_ptr<ClientEntry>> entries;
        if ( shared_queue_ )
        {
            entries.push_back( shared_queue_ );
        }
        for ( const auto &[name, entry] : clients_ )
        {
            entries.push_back( entry );
        }
        return entries;
    }

    std::vector<ClientRegistry::RecordPtr> ClientRegistry::allRequests() const
    {
        std::vector<RecordPtr> records;
        for ( const auto &entry : clients() )
        {
            auto requests = entry->requests();
            records.insert( records.end(), requests.begin(), requests.end() );
        }
        return records;
    }

    ClientRegistry::RecordPtr ClientRegistry::find( const request::RequestIdentity &identity ) const
    {
        auto entry = getClient( identity.isShared(), identity.clientName() );
        if ( !entry )
        {
            return nullptr;
        }
        auto record = entry->getRequest( identity.identifier() );
        if ( !record || record->identity() != identity )
        {
            return nullptr;
        }
        return record;
    }

    outcome::result<void> ClientRegistry::resume( const RecordPtr &record )
    {
        const auto &identity = record->identity();
        OUTCOME_TRY( auto entry, lookupOrCreateClient( identity.isShared(), identity.clientName() ) );
        return entry->resumeRequest( record );
    }
}
