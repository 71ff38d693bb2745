#include "request/fetch_variant.hpp"

#include <algorithm>

namespace reqkeep::request
{
    FetchVariant::FetchVariant( bool filter_data, uint64_t max_size, std::shared_ptr<DataBucket> return_bucket ) :
        filter_data_( filter_data ), max_size_( max_size ), return_bucket_( std::move( return_bucket ) )
    {
    }

    outcome::result<std::unique_ptr<FetchVariant>> FetchVariant::decode( codec::ByteReader &reader )
    {
        OUTCOME_TRY( auto filter_data, reader.readBool() );
        OUTCOME_TRY( auto max_size, reader.readUint64() );
        return std::make_unique<FetchVariant>( filter_data, max_size );
    }

    void FetchVariant::describe( PersistentRequestTag &tag ) const
    {
        tag.filter_data = filter_data_;
        tag.max_size    = max_size_;
    }

    outcome::result<void> FetchVariant::encode( codec::ByteWriter &writer ) const
    {
        writer.writeBool( filter_data_ );
        writer.writeUint64( max_size_ );
        return outcome::success();
    }

    outcome::result<void> FetchVariant::innerResume( RequestContext &ctx )
    {
        // The return bucket is not stored, the engine refetches into a new one
        return outcome::success();
    }

    void FetchVariant::freeData()
    {
        if ( return_bucket_ )
        {
            return_bucket_->free();
        }
    }

    void FetchVariant::onRestart( bool disable_filter_data )
    {
        if ( disable_filter_data )
        {
            filter_data_ = false;
        }
    }

    double FetchVariant::successFraction( const RequestProgress &progress ) const
    {
        if ( progress.min_success_blocks <= 0 )
        {
            return -1.0;
        }
        return std::min( 1.0, static_cast<double>( progress.fetched_blocks ) / progress.min_success_blocks );
    }
}
