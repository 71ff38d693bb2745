#ifndef REQKEEP_CLIENT_REQUEST_STATUS_CACHE_HPP
#define REQKEEP_CLIENT_REQUEST_STATUS_CACHE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "request/durability_tier.hpp"
#include "request/priority_class.hpp"
#include "request/request_identity.hpp"

namespace reqkeep::request
{
    class RequestRecord;
}

namespace reqkeep::client
{
    /**
     * Snapshot of a request as served to clients
     */
    struct RequestStatus
    {
        std::string                  identifier;
        request::RequestKind         kind;
        std::string                  target;
        request::DurabilityTier      tier;
        bool                         realtime;
        request::PriorityClass       priority_class;
        boost::optional<std::string> client_token;
        bool                         started   = false;
        bool                         finished  = false;
        bool                         succeeded = false;
        boost::optional<std::string> failure_reason;
        int64_t                      completion_time = 0;

        static RequestStatus fromRecord( const request::RequestRecord &record );
    };

    /**
     * @brief Status of the requests of one owner, kept so that listings do
     * not need to lock every record. Entries may be slightly stale.
     */
    class RequestStatusCache
    {
    public:
        void addRequest( RequestStatus status );

        void setPriority( const std::string &identifier, request::PriorityClass priority_class );

        void updateStarted( const std::string &identifier, bool started );

        void updateClientToken( const std::string &identifier, const std::string &client_token );

        void finished( const std::string                  &identifier,
                       bool                                succeeded,
                       const boost::optional<std::string> &failure_reason,
                       int64_t                             completion_time );

        /**
         * @brief Clears the completion state of a restarted request
         */
        void restarted( const std::string &identifier );

        void remove( const std::string &identifier );

        boost::optional<RequestStatus> get( const std::string &identifier ) const;

        std::vector<RequestStatus> list() const;

        size_t size() const;

    private:
        template <typename Update>
        void update( const std::string &identifier, Update &&update_status )
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            auto                        it = statuses_.find( identifier );
            if ( it != statuses_.end() )
            {
                update_status( it->second );
            }
        }

        mutable std::mutex                   mutex_;
        std::map<std::string, RequestStatus> statuses_;
    };
}

#endif // REQKEEP_CLIENT_REQUEST_STATUS_CACHE_HPP
