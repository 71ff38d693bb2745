#ifndef REQKEEP_TESTUTIL_STORAGE_TEMP_ROCKSDB_HPP
#define REQKEEP_TESTUTIL_STORAGE_TEMP_ROCKSDB_HPP

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "base/logger.hpp"
#include "storage/rocksdb/rocksdb.hpp"

namespace reqkeep::test
{
    /**
     * @brief RocksDB database in a scratch directory under the system temp
     * path. The directory is wiped on construction and removed on
     * destruction, so a test can close and reopen the database in between.
     */
    class TempRocksDB
    {
    public:
        explicit TempRocksDB( const std::string &name );

        ~TempRocksDB();

        TempRocksDB( const TempRocksDB & )            = delete;
        TempRocksDB &operator=( const TempRocksDB & ) = delete;

        /**
         * @brief Opens the database, creating it unless told otherwise
         * @return the handle, also kept as db()
         */
        outcome::result<std::shared_ptr<storage::rocksdb>> open( bool create_if_missing = true );

        /**
         * @brief Drops the kept handle. The database closes once no other
         * owner holds it.
         */
        void close();

        /**
         * @brief Closes the database and opens the existing one again
         */
        outcome::result<std::shared_ptr<storage::rocksdb>> reopen();

        std::string path() const
        {
            return path_.string();
        }

        const std::shared_ptr<storage::rocksdb> &db() const
        {
            return db_;
        }

    private:
        boost::filesystem::path           path_;
        std::shared_ptr<storage::rocksdb> db_;
        base::Logger                      logger_;
    };
}

#endif // REQKEEP_TESTUTIL_STORAGE_TEMP_ROCKSDB_HPP
