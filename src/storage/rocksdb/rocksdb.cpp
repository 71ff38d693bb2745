#include <memory>
#include <utility>

#include <rocksdb/table.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/slice_transform.h>

#include "storage/rocksdb/rocksdb.hpp"
#include "storage/rocksdb/rocksdb_cursor.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"

namespace reqkeep::storage
{
    using BlockBasedTableOptions = ::ROCKSDB_NAMESPACE::BlockBasedTableOptions;

    rocksdb::~rocksdb() = default;

    outcome::result<std::shared_ptr<rocksdb>> rocksdb::create( std::string_view path, const Options &options )
    {
        auto l = std::make_shared<rocksdb>();

        l->options_ = std::make_shared<Options>( options );

        BlockBasedTableOptions table_options;
        table_options.filter_policy.reset( ::ROCKSDB_NAMESPACE::NewBloomFilterPolicy( 10, false ) );
        table_options.whole_key_filtering = true;
        l->options_->table_factory.reset( NewBlockBasedTableFactory( table_options ) );

        // Every record key starts with the same short prefix
        l->options_->prefix_extractor.reset( ::ROCKSDB_NAMESPACE::NewCappedPrefixTransform( 3 ) );

        l->options_->info_log_level = ::ROCKSDB_NAMESPACE::InfoLogLevel::ERROR_LEVEL;

        DB  *db     = nullptr;
        auto status = DB::Open( *( l->options_ ), std::string( path ), &db );

        if ( status.ok() )
        {
            l->db_     = std::shared_ptr<DB>( db );
            l->logger_ = base::createLogger( "rocksdb" );
            // A checkpoint is only complete once it is on disk
            rocksdb::WriteOptions write_options;
            write_options.sync = true;
            l->setWriteOptions( write_options );
            return l;
        }

        if ( db )
        {
            delete db;
        }

        return error_as_result<std::shared_ptr<rocksdb>>( status );
    }

    std::unique_ptr<BufferMapCursor> rocksdb::cursor()
    {
        ReadOptions read_options     = ro_;
        read_options.total_order_seek = true;
        auto it = std::unique_ptr<Iterator>( db_->NewIterator( read_options ) );
        return std::make_unique<Cursor>( std::move( it ) );
    }

    std::unique_ptr<BufferBatch> rocksdb::batch()
    {
        return std::make_unique<Batch>( *this );
    }

    void rocksdb::setReadOptions( ReadOptions ro )
    {
        ro_ = std::move( ro );
    }

    void rocksdb::setWriteOptions( WriteOptions wo )
    {
        wo_ = wo;
    }

    outcome::result<Buffer> rocksdb::get( const Buffer &key ) const
    {
        std::string value;
        auto        status = db_->Get( ro_, make_slice( key ), &value );
        if ( status.ok() )
        {
            return Buffer{}.put( value );
        }

        // not always an actual error so don't log it
        if ( status.IsNotFound() )
        {
            return error_as_result<Buffer>( status );
        }

        return error_as_result<Buffer>( status, logger_ );
    }

    bool rocksdb::contains( const Buffer &key ) const
    {
        // here we interpret all kinds of errors as "not found".
        return get( key ).has_value();
    }

    bool rocksdb::empty() const
    {
        ReadOptions read_options     = ro_;
        read_options.total_order_seek = true;
        auto it = std::unique_ptr<Iterator>( db_->NewIterator( read_options ) );
        it->SeekToFirst();
        return !it->Valid();
    }

    outcome::result<void> rocksdb::put( const Buffer &key, const Buffer &value )
    {
        auto status = db_->Put( wo_, make_slice( key ), make_slice( value ) );
        if ( status.ok() )
        {
            return outcome::success();
        }

        return error_as_result<void>( status, logger_ );
    }

    outcome::result<void> rocksdb::put( const Buffer &key, Buffer &&value )
    {
        Buffer copy( std::move( value ) );
        return put( key, copy );
    }

    outcome::result<void> rocksdb::remove( const Buffer &key )
    {
        auto status = db_->Delete( wo_, make_slice( key ) );
        if ( status.ok() )
        {
            return outcome::success();
        }

        return error_as_result<void>( status, logger_ );
    }

} // namespace reqkeep::storage
