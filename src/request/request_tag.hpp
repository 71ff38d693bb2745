#ifndef REQKEEP_REQUEST_REQUEST_TAG_HPP
#define REQKEEP_REQUEST_REQUEST_TAG_HPP

#include <cstdint>
#include <string>

#include <boost/optional.hpp>

#include "request/durability_tier.hpp"
#include "request/priority_class.hpp"
#include "request/request_identity.hpp"

namespace reqkeep::request
{
    /**
     * Description of a request as listed to a client. Kind specific fields
     * are filled by the variant.
     */
    struct PersistentRequestTag
    {
        RequestIdentity              identity;
        std::string                  target;
        DurabilityTier               tier;
        PriorityClass                priority_class;
        int32_t                      verbosity;
        bool                         realtime;
        boost::optional<std::string> client_token;
        bool                         started;
        bool                         finished;
        bool                         succeeded;

        // GET
        boost::optional<bool>     filter_data;
        boost::optional<uint64_t> max_size;
        // PUT
        boost::optional<uint64_t>    data_length;
        boost::optional<std::string> mime_type;
    };

    /**
     * Notification of a changed request. Only the changed fields are set.
     */
    struct PersistentRequestModified
    {
        RequestIdentity              identity;
        boost::optional<std::string> client_token;
        boost::optional<PriorityClass> priority_class;
    };
}

#endif // REQKEEP_REQUEST_REQUEST_TAG_HPP
