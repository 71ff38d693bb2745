#ifndef REQKEEP_REQUEST_CLIENT_DETAIL_HPP
#define REQKEEP_REQUEST_CLIENT_DETAIL_HPP

#include <cstdint>
#include <string>

#include <boost/optional.hpp>

#include "codec/byte_stream.hpp"
#include "request/priority_class.hpp"
#include "request/request_identity.hpp"

namespace reqkeep::request
{
    /**
     * Fixed header of a durable request record: identity and the details
     * needed for scheduling, reporting and completion
     */
    struct ClientDetail
    {
        static constexpr uint64_t kMagic   = 0xebf0b4f4fa9f6721ULL;
        static constexpr uint32_t kVersion = 1;

        RequestIdentity              identity;
        bool                         realtime     = false;
        int32_t                      verbosity    = 0;
        int64_t                      startup_time = 0;
        PriorityClass                priority_class = priority::kBulkSplitfile;
        boost::optional<std::string> client_token;
        bool                         finished     = false;
    };

    /**
     * @brief Writes magic, version and the header fields in their fixed order
     */
    outcome::result<void> encodeClientDetail( const ClientDetail &detail, codec::ByteWriter &writer );

    /**
     * @brief Reads a header and validates it. Bad magic or version, an
     * identity other than expected and an out-of-range priority are format
     * errors.
     * @param expected - identity the caller is resuming
     */
    outcome::result<ClientDetail> decodeClientDetail( codec::ByteReader &reader, const RequestIdentity &expected );
}

#endif // REQKEEP_REQUEST_CLIENT_DETAIL_HPP
