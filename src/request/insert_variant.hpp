#ifndef REQKEEP_REQUEST_INSERT_VARIANT_HPP
#define REQKEEP_REQUEST_INSERT_VARIANT_HPP

#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "request/data_bucket.hpp"
#include "request/request_variant.hpp"

namespace reqkeep::request
{
    /**
     * Insert (PUT) request: uploads data under a key
     */
    class InsertVariant : public RequestVariant
    {
    public:
        InsertVariant( uint64_t                     data_length,
                       boost::optional<std::string> mime_type,
                       std::shared_ptr<DataBucket>  data = nullptr );

        static outcome::result<std::unique_ptr<InsertVariant>> decode( codec::ByteReader &reader );

        RequestKind kind() const override
        {
            return RequestKind::PUT;
        }

        void describe( PersistentRequestTag &tag ) const override;

        outcome::result<void> encode( codec::ByteWriter &writer ) const override;

        outcome::result<void> innerResume( RequestContext &ctx ) override;

        void freeData() override;

        /// Inserts are never filtered, the flag is ignored
        void onRestart( bool disable_filter_data ) override
        {
        }

        double successFraction( const RequestProgress &progress ) const override;

        uint64_t dataLength() const
        {
            return data_length_;
        }

        const boost::optional<std::string> &mimeType() const
        {
            return mime_type_;
        }

    private:
        uint64_t                     data_length_;
        boost::optional<std::string> mime_type_;
        std::shared_ptr<DataBucket>  data_;
    };
}

#endif // REQKEEP_REQUEST_INSERT_VARIANT_HPP
