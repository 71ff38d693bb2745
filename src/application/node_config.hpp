#ifndef REQKEEP_APPLICATION_NODE_CONFIG_HPP
#define REQKEEP_APPLICATION_NODE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>

#include <boost/property_tree/ptree.hpp>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"

namespace reqkeep::application
{
    /**
     * Node settings read from a JSON file
     */
    struct NodeConfig
    {
        enum class StorageBackend
        {
            ROCKSDB,
            MEMORY,
        };

        StorageBackend            storage_backend = StorageBackend::ROCKSDB;
        std::string               storage_path;
        bool                      persistence_enabled = true;
        std::chrono::milliseconds checkpoint_interval{ 600000 };
        size_t                    executor_threads            = 4;
        size_t                    max_unacknowledged_finished = 1000;
        base::LoggingConfig       logging;

        /**
         * @return config or MISSING_ENTRY, PARSER_ERROR, INVALID_VALUE
         */
        static outcome::result<NodeConfig> load( const std::string &config_path );

        static outcome::result<NodeConfig> fromString( const std::string &json );

        static outcome::result<NodeConfig> fromTree( const boost::property_tree::ptree &tree );
    };
}

#endif // REQKEEP_APPLICATION_NODE_CONFIG_HPP
