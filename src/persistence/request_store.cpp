#include "persistence/request_store.hpp"

#include "codec/byte_stream.hpp"
#include "codec/checksum_checker.hpp"

namespace reqkeep::persistence
{
    namespace
    {
        constexpr std::string_view kRecordKeyPrefix = "/requests/";
    }

    RequestStore::RequestStore( std::shared_ptr<storage::BufferStorage> storage,
                                std::shared_ptr<client::ClientRegistry> persistent_root ) :
        storage_( std::move( storage ) ), persistent_root_( std::move( persistent_root ) )
    {
    }

    base::Buffer RequestStore::keyPrefix()
    {
        return base::Buffer::fromString( kRecordKeyPrefix );
    }

    outcome::result<base::Buffer> RequestStore::recordKey( const request::RequestIdentity &identity )
    {
        codec::ByteWriter writer;
        OUTCOME_TRY( identity.writeTo( writer ) );
        auto key = keyPrefix();
        key.putBuffer( writer.buffer() );
        return key;
    }

    outcome::result<request::RequestIdentity> RequestStore::identityFromKey( const base::Buffer &key )
    {
        auto prefix = keyPrefix();
        if ( !key.startsWith( prefix ) )
        {
            return codec::DecodeError::INVALID_DATA;
        }
        auto              encoded = key.subbuffer( prefix.size(), key.size() - prefix.size() );
        codec::ByteReader reader( encoded );
        OUTCOME_TRY( auto identity, request::RequestIdentity::readFrom( reader ) );
        OUTCOME_TRY( reader.expectEnd() );
        return identity;
    }

    outcome::result<base::Buffer> RequestStore::encodeRecord( const request::RequestRecord &record )
    {
        codec::ByteWriter writer;
        OUTCOME_TRY( record.serialize( writer ) );
        return codec::ChecksumChecker::appendChecksum( writer.buffer() );
    }

    outcome::result<RequestStore::RecordPtr> RequestStore::decodeRecord( const base::Buffer                        &key,
                                                                         const base::Buffer                        &value,
                                                                         const std::shared_ptr<clock::SystemClock> &clock )
    {
        OUTCOME_TRY( auto identity, identityFromKey( key ) );
        OUTCOME_TRY( auto payload, codec::ChecksumChecker::verifyAndStrip( value ) );
        codec::ByteReader reader( payload );
        return request::RequestRecord::restore( reader, identity, clock );
    }

    outcome::result<void> RequestStore::forEachStored( storage::BufferStorage                    &storage,
                                                       const std::shared_ptr<clock::SystemClock> &clock,
                                                       const Visitor                             &visitor )
    {
        auto prefix = keyPrefix();
        auto cursor = storage.cursor();
        OUTCOME_TRY( cursor->seek( prefix ) );
        while ( cursor->isValid() )
        {
            OUTCOME_TRY( auto key, cursor->key() );
            if ( !key.startsWith( prefix ) )
            {
                break;
            }
            OUTCOME_TRY( auto value, cursor->value() );
            visitor( key, decodeRecord( key, value, clock ) );
            OUTCOME_TRY( cursor->next() );
        }
        return outcome::success();
    }

    outcome::result<void> RequestStore::checkpoint( bool final )
    {
        std::lock_guard<std::mutex> lock( mutex_ );

        auto                   batch = storage_->batch();
        std::set<base::Buffer> written;
        for ( const auto &record : persistent_root_->allRequests() )
        {
            if ( record->tier() != request::DurabilityTier::CRASH_PERSISTENT )
            {
                continue;
            }
            auto key = recordKey( record->identity() );
            if ( !key )
            {
                logger_->error( "Cannot store {}: {}", record->identity().toString(), key.error().message() );
                continue;
            }
            auto value = encodeRecord( *record );
            if ( !value )
            {
                logger_->error( "Cannot store {}: {}", record->identity().toString(), value.error().message() );
                // the request is still live, its last good copy stays
                if ( stored_keys_.count( key.value() ) != 0 )
                {
                    written.insert( std::move( key.value() ) );
                }
                continue;
            }
            OUTCOME_TRY( batch->put( key.value(), std::move( value.value() ) ) );
            written.insert( std::move( key.value() ) );
        }

        size_t removed = 0;
        for ( const auto &key : stored_keys_ )
        {
            if ( written.find( key ) == written.end() )
            {
                OUTCOME_TRY( batch->remove( key ) );
                ++removed;
            }
        }

        OUTCOME_TRY( batch->commit() );
        stored_keys_ = std::move( written );
        if ( final )
        {
            logger_->info( "Final checkpoint: {} requests stored", stored_keys_.size() );
        }
        else
        {
            logger_->debug( "Checkpoint: {} requests stored, {} removed", stored_keys_.size(), removed );
        }
        return outcome::success();
    }

    ResumeReport RequestStore::resumeAll( request::RequestContext &ctx )
    {
        ResumeReport report;
        auto scanned = forEachStored( *storage_,
                                      ctx.clock,
                                      [&]( const base::Buffer &key, const outcome::result<RecordPtr> &record )
                                      {
                                          if ( !record )
                                          {
                                              logger_->error( "Unreadable record {}: {}",
                                                              key.toHex(),
                                                              record.error().message() );
                                              ++report.failed;
                                              return;
                                          }
                                          auto resumed = record.value()->onResume( ctx );
                                          if ( !resumed )
                                          {
                                              logger_->error( "Failed to resume {}: {}",
                                                              record.value()->identity().toString(),
                                                              resumed.error().message() );
                                              ++report.failed;
                                              return;
                                          }
                                          std::lock_guard<std::mutex> lock( mutex_ );
                                          stored_keys_.insert( key );
                                          ++report.resumed;
                                      } );
        if ( !scanned )
        {
            logger_->error( "Failed to read stored requests: {}", scanned.error().message() );
        }
        logger_->info( "Resumed {} stored requests, {} failed", report.resumed, report.failed );
        return report;
    }
}
