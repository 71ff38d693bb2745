#ifndef REQKEEP_REQUEST_ENGINE_HPP
#define REQKEEP_REQUEST_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "outcome/outcome.hpp"
#include "request/priority_class.hpp"
#include "request/request_identity.hpp"

namespace reqkeep::request
{
    struct RequestContext;

    /**
     * Scheduling band a request is executed in. Durable requests are bound
     * to a persistent binding.
     */
    class EngineBinding
    {
    public:
        EngineBinding( bool persistent, bool realtime ) : persistent_( persistent ), realtime_( realtime )
        {
        }

        [[nodiscard]] bool persistent() const
        {
            return persistent_;
        }

        [[nodiscard]] bool realTimeFlag() const
        {
            return realtime_;
        }

        bool operator==( const EngineBinding &other ) const
        {
            return persistent_ == other.persistent_ && realtime_ == other.realtime_;
        }

    private:
        bool persistent_;
        bool realtime_;
    };

    /**
     * Progress counters as reported by the engine
     */
    struct RequestProgress
    {
        int32_t total_blocks          = 0;
        int32_t min_success_blocks    = 0;
        int32_t fetched_blocks        = 0;
        int32_t failed_blocks         = 0;
        int32_t fatally_failed_blocks = 0;
        bool    total_finalized       = false;
    };

    /**
     * Callbacks the engine raises for a bound request. A callback may arrive
     * on any engine thread.
     */
    class RequestCallback
    {
    public:
        virtual ~RequestCallback() = default;

        virtual void onSuccess( RequestContext &ctx ) = 0;

        /**
         * @param reason - engine supplied description, stored verbatim
         */
        virtual void onFailure( const std::string &reason, RequestContext &ctx ) = 0;

        virtual void onMajorProgress() = 0;
    };

    /**
     * Engine side handle of one request
     */
    class ClientRequester
    {
    public:
        virtual ~ClientRequester() = default;

        virtual outcome::result<void> start( RequestContext &ctx ) = 0;

        virtual void cancel( RequestContext &ctx ) = 0;

        virtual bool canRestart() const = 0;

        virtual outcome::result<void> restart( RequestContext &ctx, bool disable_filter_data ) = 0;

        virtual void setPriorityClass( PriorityClass priority_class, RequestContext &ctx ) = 0;

        /**
         * @brief Re-attaches engine state of a request loaded from durable storage
         */
        virtual outcome::result<void> onResume( RequestContext &ctx ) = 0;

        virtual outcome::result<void> onShutdown( RequestContext &ctx ) = 0;

        virtual RequestProgress progress() const = 0;
    };

    struct EngineRequestSpec
    {
        RequestKind                    kind;
        std::string                    target;
        PriorityClass                  priority_class;
        EngineBinding                  binding;
        std::weak_ptr<RequestCallback> callback;
        bool                           resuming = false;
    };

    /**
     * Fetch and insert execution engine
     */
    class RequestEngine
    {
    public:
        virtual ~RequestEngine() = default;

        /**
         * @brief Creates the engine handle of a request. Called at most once per
         * record.
         */
        virtual outcome::result<std::shared_ptr<ClientRequester>> bindRequester( const RequestIdentity   &identity,
                                                                                 const EngineRequestSpec &spec ) = 0;
    };
}

#endif // REQKEEP_REQUEST_ENGINE_HPP
