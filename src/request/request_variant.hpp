#ifndef REQKEEP_REQUEST_REQUEST_VARIANT_HPP
#define REQKEEP_REQUEST_REQUEST_VARIANT_HPP

#include "codec/byte_stream.hpp"
#include "outcome/outcome.hpp"
#include "request/engine.hpp"
#include "request/request_identity.hpp"
#include "request/request_tag.hpp"

namespace reqkeep::request
{
    struct RequestContext;

    /**
     * Kind specific part of a request. A RequestRecord owns exactly one and
     * calls it under the record lock.
     */
    class RequestVariant
    {
    public:
        virtual ~RequestVariant() = default;

        virtual RequestKind kind() const = 0;

        /**
         * @brief Fills the kind specific fields of a listing tag
         */
        virtual void describe( PersistentRequestTag &tag ) const = 0;

        /**
         * @brief Writes the variant body that follows the record body
         */
        virtual outcome::result<void> encode( codec::ByteWriter &writer ) const = 0;

        /**
         * @brief Re-acquires kind specific resources after a restart
         */
        virtual outcome::result<void> innerResume( RequestContext &ctx ) = 0;

        /**
         * @brief Releases payload buffers. The record calls this at most once.
         */
        virtual void freeData() = 0;

        virtual void onRestart( bool disable_filter_data ) = 0;

        /**
         * @return fraction of the work done, negative if unknown
         */
        virtual double successFraction( const RequestProgress &progress ) const = 0;
    };
}

#endif // REQKEEP_REQUEST_REQUEST_VARIANT_HPP
