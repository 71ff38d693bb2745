#include "request/insert_variant.hpp"

#include <algorithm>

namespace reqkeep::request
{
    InsertVariant::InsertVariant( uint64_t                     data_length,
                                  boost::optional<std::string> mime_type,
                                  std::shared_ptr<DataBucket>  data ) :
        data_length_( data_length ), mime_type_( std::move( mime_type ) ), data_( std::move( data ) )
    {
    }

    outcome::result<std::unique_ptr<InsertVariant>> InsertVariant::decode( codec::ByteReader &reader )
    {
        OUTCOME_TRY( auto data_length, reader.readUint64() );
        OUTCOME_TRY( auto mime_type, reader.readOptionalUtf() );
        return std::make_unique<InsertVariant>( data_length, std::move( mime_type ) );
    }

    void InsertVariant::describe( PersistentRequestTag &tag ) const
    {
        tag.data_length = data_length_;
        tag.mime_type   = mime_type_;
    }

    outcome::result<void> InsertVariant::encode( codec::ByteWriter &writer ) const
    {
        writer.writeUint64( data_length_ );
        OUTCOME_TRY( writer.writeOptionalUtf( mime_type_ ) );
        return outcome::success();
    }

    outcome::result<void> InsertVariant::innerResume( RequestContext &ctx )
    {
        return outcome::success();
    }

    void InsertVariant::freeData()
    {
        if ( data_ )
        {
            data_->free();
        }
    }

    double InsertVariant::successFraction( const RequestProgress &progress ) const
    {
        if ( progress.total_blocks <= 0 )
        {
            return -1.0;
        }
        return std::min( 1.0, static_cast<double>( progress.fetched_blocks ) / progress.total_blocks );
    }
}
