#ifndef REQKEEP_REQUEST_FETCH_VARIANT_HPP
#define REQKEEP_REQUEST_FETCH_VARIANT_HPP

#include <memory>

#include "request/data_bucket.hpp"
#include "request/request_variant.hpp"

namespace reqkeep::request
{
    /**
     * Fetch (GET) request: downloads a key, optionally filtering the content
     */
    class FetchVariant : public RequestVariant
    {
    public:
        /**
         * @param return_bucket - buffer the fetched data is returned in, may be null
         */
        FetchVariant( bool filter_data, uint64_t max_size, std::shared_ptr<DataBucket> return_bucket = nullptr );

        static outcome::result<std::unique_ptr<FetchVariant>> decode( codec::ByteReader &reader );

        RequestKind kind() const override
        {
            return RequestKind::GET;
        }

        void describe( PersistentRequestTag &tag ) const override;

        outcome::result<void> encode( codec::ByteWriter &writer ) const override;

        outcome::result<void> innerResume( RequestContext &ctx ) override;

        void freeData() override;

        void onRestart( bool disable_filter_data ) override;

        double successFraction( const RequestProgress &progress ) const override;

        bool filterData() const
        {
            return filter_data_;
        }

        uint64_t maxSize() const
        {
            return max_size_;
        }

    private:
        bool                        filter_data_;
        uint64_t                    max_size_;
        std::shared_ptr<DataBucket> return_bucket_;
    };
}

#endif // REQKEEP_REQUEST_FETCH_VARIANT_HPP
