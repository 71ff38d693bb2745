#include "request/request_record.hpp"

#include <limits>

#include "client/client_entry.hpp"
#include "client/client_registry.hpp"
#include "client/connection_session.hpp"
#include "client/request_status_cache.hpp"
#include "jobs/executor.hpp"
#include "jobs/persistent_job_runner.hpp"
#include "request/client_detail.hpp"
#include "request/fetch_variant.hpp"
#include "request/insert_variant.hpp"
#include "request/request_error.hpp"

namespace reqkeep::request
{
    RequestRecord::RequestRecord( RequestIdentity                     identity,
                                  std::string                         target,
                                  DurabilityTier                      tier,
                                  bool                                realtime,
                                  int32_t                             verbosity,
                                  PriorityClass                       priority_class,
                                  boost::optional<std::string>        client_token,
                                  int64_t                             startup_time,
                                  std::unique_ptr<RequestVariant>     variant,
                                  std::shared_ptr<clock::SystemClock> clock ) :
        identity_( std::move( identity ) ),
        target_( std::move( target ) ),
        tier_( tier ),
        realtime_( realtime ),
        verbosity_( identity_.isShared() ? std::numeric_limits<int32_t>::max() : verbosity ),
        startup_time_( startup_time ),
        clock_( std::move( clock ) ),
        variant_( std::move( variant ) ),
        priority_class_( priority_class ),
        client_token_( std::move( client_token ) ),
        last_activity_( startup_time )
    {
    }

    outcome::result<RequestRecord::Ptr> RequestRecord::createForSession(
        RequestContext                                   &ctx,
        RequestParams                                     params,
        const std::shared_ptr<client::ConnectionSession> &session,
        std::unique_ptr<RequestVariant>                   variant )
    {
        if ( params.tier != DurabilityTier::CONNECTION_SCOPED )
        {
            return RequestError::TIER_MISMATCH;
        }
        return create( ctx, std::move( params ), session, std::move( variant ) );
    }

    outcome::result<RequestRecord::Ptr> RequestRecord::createForClient(
        RequestContext                             &ctx,
        RequestParams                               params,
        const std::shared_ptr<client::ClientEntry> &client,
        std::unique_ptr<RequestVariant>             variant )
    {
        if ( params.tier == DurabilityTier::CONNECTION_SCOPED || client->tier() != params.tier )
        {
            return RequestError::TIER_MISMATCH;
        }
        if ( params.identity.isShared() != client->isShared() ||
             ( !client->isShared() && params.identity.clientName() != client->name() ) )
        {
            return RequestError::INVALID_IDENTITY;
        }
        return create( ctx, std::move( params ), client, std::move( variant ) );
    }

    outcome::result<RequestRecord::Ptr> RequestRecord::create( RequestContext                       &ctx,
                                                               RequestParams                         params,
                                                               const std::shared_ptr<RequestOwner> &owner,
                                                               std::unique_ptr<RequestVariant>       variant )
    {
        if ( !priority::isValid( params.priority_class ) )
        {
            return RequestError::INVALID_PRIORITY;
        }
        if ( !variant || variant->kind() != params.identity.kind() )
        {
            return RequestError::INVALID_IDENTITY;
        }
        if ( !ctx.engine )
        {
            return RequestError::ENGINE_UNAVAILABLE;
        }
        if ( params.tier == DurabilityTier::CRASH_PERSISTENT && ( !ctx.job_runner || !ctx.job_runner->isEnabled() ) )
        {
            return RequestError::PERSISTENCE_DISABLED;
        }

        auto binding = owner->lowLevelEngineFactory( params.realtime );
        if ( binding.persistent() != ( params.tier == DurabilityTier::CRASH_PERSISTENT ) )
        {
            return RequestError::BINDING_MISMATCH;
        }

        auto startup_time = static_cast<int64_t>( ctx.clock->nowUint64() );
        Ptr  record( new RequestRecord( std::move( params.identity ),
                                       std::move( params.target ),
                                       params.tier,
                                       params.realtime,
                                       params.verbosity,
                                       params.priority_class,
                                       std::move( params.client_token ),
                                       startup_time,
                                       std::move( variant ),
                                       ctx.clock ) );
        record->owner_   = owner;
        record->binding_ = binding;

        // strings must fit a stored record whatever the tier
        codec::ByteWriter scratch;
        OUTCOME_TRY( record->encodeBody( scratch ) );

        OUTCOME_TRY( owner->registerRequest( record ) );

        auto requester = record->bindRequester( ctx, false );
        if ( !requester )
        {
            record->logger_->error( "Engine refused request {}: {}", record->identity_.toString(), requester.error().message() );
            {
                std::lock_guard<std::mutex> lock( record->mutex_ );
                record->cancelled_ = true;
            }
            owner->requestRemoved( record );
            return requester.error();
        }

        if ( record->tier_ == DurabilityTier::CRASH_PERSISTENT && ctx.job_runner )
        {
            ctx.job_runner->requestCheckpointSoon();
        }
        record->logger_->debug( "Created {} request {} for {}", toString( record->tier_ ), record->identity_.toString(),
                                record->target_ );
        return record;
    }

    outcome::result<RequestRecord::Ptr> RequestRecord::restore( codec::ByteReader                         &reader,
                                                                const RequestIdentity                     &expected_identity,
                                                                const std::shared_ptr<clock::SystemClock> &clock )
    {
        OUTCOME_TRY( auto detail, decodeClientDetail( reader, expected_identity ) );
        OUTCOME_TRY( auto target, reader.readUtf() );
        OUTCOME_TRY( auto succeeded, reader.readBool() );
        OUTCOME_TRY( auto completion_time, reader.readInt64() );
        OUTCOME_TRY( auto failure_reason, reader.readOptionalUtf() );

        std::unique_ptr<RequestVariant> variant;
        switch ( detail.identity.kind() )
        {
            case RequestKind::GET:
            {
                OUTCOME_TRY( auto fetch, FetchVariant::decode( reader ) );
                variant = std::move( fetch );
                break;
            }
            case RequestKind::PUT:
            {
                OUTCOME_TRY( auto insert, InsertVariant::decode( reader ) );
                variant = std::move( insert );
                break;
            }
            default:
                return codec::DecodeError::UNKNOWN_REQUEST_KIND;
        }
        OUTCOME_TRY( reader.expectEnd() );

        Ptr record( new RequestRecord( std::move( detail.identity ),
                                       std::move( target ),
                                       DurabilityTier::CRASH_PERSISTENT,
                                       detail.realtime,
                                       detail.verbosity,
                                       detail.priority_class,
                                       std::move( detail.client_token ),
                                       detail.startup_time,
                                       std::move( variant ),
                                       clock ) );
        record->finished_        = detail.finished;
        record->succeeded_       = succeeded;
        record->completion_time_ = completion_time;
        record->failure_reason_  = std::move( failure_reason );
        return record;
    }

    outcome::result<std::shared_ptr<ClientRequester>> RequestRecord::bindRequester( RequestContext &ctx, bool resuming )
    {
        if ( !ctx.engine )
        {
            return RequestError::ENGINE_UNAVAILABLE;
        }
        EngineRequestSpec spec{ identity_.kind(),
                                target_,
                                priorityClass(),
                                *engineBinding(),
                                std::weak_ptr<RequestCallback>( shared_from_this() ),
                                resuming };
        OUTCOME_TRY( auto requester, ctx.engine->bindRequester( identity_, spec ) );
        if ( !requester )
        {
            return RequestError::ENGINE_UNAVAILABLE;
        }

        std::lock_guard<std::mutex> lock( mutex_ );
        if ( !requester_ )
        {
            requester_ = std::move( requester );
        }
        return requester_;
    }

    outcome::result<void> RequestRecord::start( RequestContext &ctx )
    {
        std::shared_ptr<ClientRequester> requester;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( cancelled_ )
            {
                return RequestError::REQUEST_CANCELLED;
            }
            if ( started_ || finished_ )
            {
                return outcome::success();
            }
            if ( !requester_ )
            {
                return RequestError::ENGINE_UNAVAILABLE;
            }
            started_   = true;
            requester = requester_;
        }

        auto started = requester->start( ctx );
        auto owner   = this->owner();
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( !started )
            {
                started_ = false;
            }
            else if ( owner )
            {
                owner->statusCache().updateStarted( identity_.identifier(), started_ );
            }
        }
        if ( !started )
        {
            logger_->warn( "Failed to start {}: {}", identity_.toString(), started.error().message() );
            return started.error();
        }

        logger_->debug( "Started {}", identity_.toString() );
        if ( owner )
        {
            owner->requestStatusUpdated( identity_ );
        }
        return outcome::success();
    }

    void RequestRecord::cancel( RequestContext &ctx )
    {
        bool                             first = false;
        std::shared_ptr<ClientRequester> requester;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            first      = !cancelled_;
            cancelled_ = true;
            requester  = requester_;
        }

        if ( first )
        {
            logger_->debug( "Cancelled {}", identity_.toString() );
            if ( requester )
            {
                requester->cancel( ctx );
            }
            if ( auto owner = this->owner() )
            {
                owner->requestRemoved( shared_from_this() );
            }
        }
        freeData();
    }

    outcome::result<bool> RequestRecord::modify( const boost::optional<std::string>   &new_token,
                                                 const boost::optional<PriorityClass> &new_priority,
                                                 RequestContext                       &ctx )
    {
        if ( new_priority && !priority::isValid( *new_priority ) )
        {
            return RequestError::INVALID_PRIORITY;
        }
        if ( new_token && new_token->size() > codec::kMaxUtfLength )
        {
            return codec::EncodeError::STRING_TOO_LONG;
        }

        // concurrent modifications reach the engine in the order they were applied
        std::lock_guard<std::mutex> modify_lock( modify_mutex_ );

        PersistentRequestModified        modification{ identity_ };
        std::shared_ptr<ClientRequester> requester;
        auto                             owner = this->owner();
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( new_token && new_token != client_token_ )
            {
                client_token_              = new_token;
                modification.client_token = new_token;
                if ( owner )
                {
                    owner->statusCache().updateClientToken( identity_.identifier(), *new_token );
                }
            }
            if ( new_priority && *new_priority != priority_class_ )
            {
                priority_class_              = *new_priority;
                modification.priority_class = new_priority;
                requester                   = requester_;
                if ( owner )
                {
                    owner->statusCache().setPriority( identity_.identifier(), priority_class_ );
                }
            }
        }

        if ( !modification.client_token && !modification.priority_class )
        {
            return false;
        }

        if ( requester )
        {
            requester->setPriorityClass( *modification.priority_class, ctx );
        }
        if ( tier_ == DurabilityTier::CRASH_PERSISTENT && ctx.job_runner )
        {
            ctx.job_runner->requestCheckpointSoon();
        }
        if ( owner )
        {
            owner->requestModified( modification );
        }
        return true;
    }

    bool RequestRecord::canRestart() const
    {
        std::shared_ptr<ClientRequester> requester;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( cancelled_ )
            {
                return false;
            }
            requester = requester_;
        }
        return requester && requester->canRestart();
    }

    outcome::result<void> RequestRecord::restart( RequestContext &ctx, bool disable_filter_data )
    {
        if ( !canRestart() )
        {
            return RequestError::CANNOT_RESTART;
        }

        auto owner       = this->owner();
        bool was_started = false;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            was_started = started_;
            started_    = false;
            if ( owner )
            {
                owner->statusCache().updateStarted( identity_.identifier(), false );
            }
        }

        auto self = shared_from_this();
        if ( tier_ == DurabilityTier::CRASH_PERSISTENT )
        {
            outcome::result<void> submitted = RequestError::PERSISTENCE_DISABLED;
            if ( ctx.job_runner )
            {
                submitted = ctx.job_runner->submit(
                    [self, disable_filter_data]( RequestContext &job_ctx )
                    { return self->runRestart( job_ctx, disable_filter_data ); },
                    jobs::JobPriority::HIGH );
            }
            if ( !submitted )
            {
                {
                    std::lock_guard<std::mutex> lock( mutex_ );
                    started_ = was_started;
                    if ( owner )
                    {
                        owner->statusCache().updateStarted( identity_.identifier(), started_ );
                    }
                }
                logger_->error( "Restart of {} refused: {}", identity_.toString(), submitted.error().message() );
                return submitted.error();
            }
        }
        else if ( ctx.executor )
        {
            ctx.executor->execute( [self, disable_filter_data, task_ctx = ctx]() mutable
                                   { self->runRestart( task_ctx, disable_filter_data ); },
                                   "Restart request" );
        }
        else
        {
            runRestart( ctx, disable_filter_data );
        }

        if ( owner )
        {
            owner->requestStatusUpdated( identity_ );
        }
        return outcome::success();
    }

    bool RequestRecord::runRestart( RequestContext &ctx, bool disable_filter_data )
    {
        std::shared_ptr<ClientRequester> requester;
        auto                             owner = this->owner();
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( cancelled_ )
            {
                return false;
            }
            finished_        = false;
            succeeded_       = false;
            failure_reason_  = boost::none;
            completion_time_ = 0;
            variant_->onRestart( disable_filter_data );
            requester = requester_;
            if ( owner )
            {
                owner->statusCache().restarted( identity_.identifier() );
            }
        }

        auto restarted = requester->restart( ctx, disable_filter_data );
        if ( !restarted )
        {
            logger_->error( "Engine failed to restart {}: {}", identity_.toString(), restarted.error().message() );
            finish( false, "Restart failed: " + restarted.error().message(), ctx );
            return false;
        }

        {
            std::lock_guard<std::mutex> lock( mutex_ );
            started_       = true;
            last_activity_ = now();
            if ( owner )
            {
                owner->statusCache().updateStarted( identity_.identifier(), true );
            }
        }
        logger_->debug( "Restarted {}", identity_.toString() );
        if ( owner )
        {
            owner->requestStatusUpdated( identity_ );
        }
        return tier_ == DurabilityTier::CRASH_PERSISTENT;
    }

    void RequestRecord::onSuccess( RequestContext &ctx )
    {
        finish( true, boost::none, ctx );
    }

    void RequestRecord::onFailure( const std::string &reason, RequestContext &ctx )
    {
        finish( false, reason, ctx );
    }

    void RequestRecord::finish( bool success, boost::optional<std::string> reason, RequestContext &ctx )
    {
        auto owner     = this->owner();
        bool cancelled = false;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            cancelled = cancelled_;
            if ( !cancelled )
            {
                if ( finished_ )
                {
                    return;
                }
                finished_        = true;
                succeeded_       = success;
                failure_reason_  = std::move( reason );
                completion_time_ = now();
                last_activity_   = completion_time_;
                if ( owner )
                {
                    owner->statusCache().finished( identity_.identifier(), succeeded_, failure_reason_,
                                                   completion_time_ );
                }
            }
        }

        if ( cancelled )
        {
            freeData();
            return;
        }

        if ( success )
        {
            logger_->debug( "Request {} succeeded", identity_.toString() );
        }
        else
        {
            logger_->debug( "Request {} failed", identity_.toString() );
        }
        if ( owner )
        {
            owner->requestStatusUpdated( identity_ );
            owner->finishedClientRequest( shared_from_this(), ctx );
        }
        if ( tier_ == DurabilityTier::CRASH_PERSISTENT && ctx.job_runner )
        {
            ctx.job_runner->requestCheckpointSoon();
        }
    }

    void RequestRecord::onMajorProgress()
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        last_activity_ = now();
    }

    void RequestRecord::dropped( RequestContext &ctx )
    {
        logger_->debug( "Dropping unacknowledged request {}", identity_.toString() );
        cancel( ctx );
        freeData();
    }

    outcome::result<void> RequestRecord::onResume( RequestContext &ctx )
    {
        if ( tier_ != DurabilityTier::CRASH_PERSISTENT )
        {
            return RequestError::NOT_PERSISTENT;
        }
        if ( !ctx.persistent_root )
        {
            return RequestError::RESUME_FAILED;
        }

        auto client = ctx.persistent_root->lookupOrCreateClient( identity_.isShared(), identity_.clientName() );
        if ( !client )
        {
            logger_->error( "No client for {}: {}", identity_.toString(), client.error().message() );
            return RequestError::RESUME_FAILED;
        }
        auto binding = client.value()->lowLevelEngineFactory( realtime_ );
        if ( !binding.persistent() )
        {
            logger_->error( "Client of {} has no persistent engine binding", identity_.toString() );
            return RequestError::RESUME_FAILED;
        }
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            owner_   = client.value();
            binding_ = binding;
            auto resumed = variant_->innerResume( ctx );
            if ( !resumed )
            {
                logger_->error( "Failed to resume {}: {}", identity_.toString(), resumed.error().message() );
                return RequestError::RESUME_FAILED;
            }
        }

        auto requester = bindRequester( ctx, true );
        if ( !requester )
        {
            logger_->error( "Engine refused resumed request {}: {}", identity_.toString(), requester.error().message() );
            return RequestError::RESUME_FAILED;
        }
        auto engine_resumed = requester.value()->onResume( ctx );
        if ( !engine_resumed )
        {
            logger_->error( "Engine failed to resume {}: {}", identity_.toString(), engine_resumed.error().message() );
            return RequestError::RESUME_FAILED;
        }

        auto registered = ctx.persistent_root->resume( shared_from_this() );
        if ( !registered )
        {
            logger_->error( "Failed to register resumed request {}: {}", identity_.toString(), registered.error().message() );
            return RequestError::RESUME_FAILED;
        }
        resumed_ = true;
        logger_->debug( "Resumed {}", identity_.toString() );
        return outcome::success();
    }

    void RequestRecord::onShutdown( RequestContext &ctx )
    {
        std::shared_ptr<ClientRequester> requester;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            requester = requester_;
        }
        if ( !requester )
        {
            return;
        }
        auto flushed = requester->onShutdown( ctx );
        if ( !flushed )
        {
            logger_->error( "Shutdown of {} failed: {}", identity_.toString(), flushed.error().message() );
        }
    }

    outcome::result<void> RequestRecord::serialize( codec::ByteWriter &writer ) const
    {
        if ( tier_ != DurabilityTier::CRASH_PERSISTENT )
        {
            return RequestError::NOT_PERSISTENT;
        }
        return encodeBody( writer );
    }

    outcome::result<void> RequestRecord::encodeBody( codec::ByteWriter &writer ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        ClientDetail                detail{ identity_ };
        detail.realtime       = realtime_;
        detail.verbosity      = verbosity_;
        detail.startup_time   = startup_time_;
        detail.priority_class = priority_class_;
        detail.client_token   = client_token_;
        detail.finished       = finished_;
        OUTCOME_TRY( encodeClientDetail( detail, writer ) );

        OUTCOME_TRY( writer.writeUtf( target_ ) );
        writer.writeBool( succeeded_ );
        writer.writeInt64( completion_time_ );
        OUTCOME_TRY( writer.writeOptionalUtf( failure_reason_ ) );
        return variant_->encode( writer );
    }

    void RequestRecord::freeData()
    {
        if ( data_freed_.exchange( true ) )
        {
            return;
        }
        std::lock_guard<std::mutex> lock( mutex_ );
        variant_->freeData();
    }

    std::shared_ptr<RequestOwner> RequestRecord::owner() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return owner_.lock();
    }

    int64_t RequestRecord::now() const
    {
        return static_cast<int64_t>( clock_->nowUint64() );
    }

    PriorityClass RequestRecord::priorityClass() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return priority_class_;
    }

    boost::optional<std::string> RequestRecord::clientToken() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return client_token_;
    }

    bool RequestRecord::isStarted() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return started_;
    }

    bool RequestRecord::isFinished() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return finished_;
    }

    bool RequestRecord::hasSucceeded() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return succeeded_;
    }

    bool RequestRecord::isCancelled() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return cancelled_;
    }

    boost::optional<std::string> RequestRecord::failureReason() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return failure_reason_;
    }

    int64_t RequestRecord::completionTime() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return completion_time_;
    }

    int64_t RequestRecord::lastActivity() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return last_activity_;
    }

    boost::optional<EngineBinding> RequestRecord::engineBinding() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return binding_;
    }

    RequestProgress RequestRecord::progress() const
    {
        std::shared_ptr<ClientRequester> requester;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            requester = requester_;
        }
        return requester ? requester->progress() : RequestProgress{};
    }

    double RequestRecord::successFraction() const
    {
        auto                        current = progress();
        std::lock_guard<std::mutex> lock( mutex_ );
        return variant_->successFraction( current );
    }

    PersistentRequestTag RequestRecord::persistentTag() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        PersistentRequestTag        tag{ identity_, target_,       tier_,    priority_class_, verbosity_,
                                  realtime_, client_token_, started_, finished_,       succeeded_ };
        variant_->describe( tag );
        return tag;
    }

    bool RequestRecord::isTotalFinalized() const
    {
        return progress().total_finalized;
    }

    bool RequestRecord::fullyResumed() const
    {
        return resumed_;
    }
}
