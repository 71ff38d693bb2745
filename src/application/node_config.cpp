#include "application/node_config.hpp"

#include <sstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "application/impl/config_reader/pt_util.hpp"

namespace reqkeep::application
{
    namespace pt = boost::property_tree;

    namespace
    {
        outcome::result<NodeConfig::StorageBackend> parseBackend( const std::string &name )
        {
            if ( boost::iequals( name, "rocksdb" ) )
            {
                return NodeConfig::StorageBackend::ROCKSDB;
            }
            if ( boost::iequals( name, "memory" ) )
            {
                return NodeConfig::StorageBackend::MEMORY;
            }
            return ConfigReaderError::INVALID_VALUE;
        }

        outcome::result<spdlog::level::level_enum> parseLevel( const std::string &name )
        {
            auto level = spdlog::level::from_str( name );
            // from_str maps unknown names to off
            if ( level == spdlog::level::off && name != "off" )
            {
                return ConfigReaderError::INVALID_VALUE;
            }
            return level;
        }

        outcome::result<void> loadStorage( const pt::ptree &tree, NodeConfig &config )
        {
            auto backend = tree.get<std::string>( "storage.backend", "rocksdb" );
            OUTCOME_TRY( auto parsed, parseBackend( backend ) );
            config.storage_backend = parsed;
            if ( config.storage_backend == NodeConfig::StorageBackend::ROCKSDB )
            {
                OUTCOME_TRY( auto path, ensure( tree.get_optional<std::string>( "storage.path" ) ) );
                if ( path.empty() )
                {
                    return ConfigReaderError::INVALID_VALUE;
                }
                config.storage_path = path;
            }
            return outcome::success();
        }

        outcome::result<void> loadPersistence( const pt::ptree &tree, NodeConfig &config )
        {
            config.persistence_enabled = tree.get<bool>( "persistence.enabled", true );
            auto interval              = tree.get<int64_t>( "persistence.checkpoint_interval_ms", 600000 );
            if ( interval <= 0 )
            {
                return ConfigReaderError::INVALID_VALUE;
            }
            config.checkpoint_interval = std::chrono::milliseconds( interval );
            return outcome::success();
        }

        outcome::result<void> loadLimits( const pt::ptree &tree, NodeConfig &config )
        {
            auto threads = tree.get<int64_t>( "executor.threads", 4 );
            if ( threads <= 0 )
            {
                return ConfigReaderError::INVALID_VALUE;
            }
            config.executor_threads = static_cast<size_t>( threads );

            auto max_finished = tree.get<int64_t>( "clients.max_unacknowledged_finished", 1000 );
            if ( max_finished < 1 )
            {
                return ConfigReaderError::INVALID_VALUE;
            }
            config.max_unacknowledged_finished = static_cast<size_t>( max_finished );
            return outcome::success();
        }

        outcome::result<void> loadLogging( const pt::ptree &tree, NodeConfig &config )
        {
            OUTCOME_TRY( auto level, parseLevel( tree.get<std::string>( "logging.level", "info" ) ) );
            config.logging.level = level;
            config.logging.file  = tree.get<std::string>( "logging.file", "" );
            config.logging.debug_pattern = level <= spdlog::level::debug;
            return outcome::success();
        }
    }

    outcome::result<NodeConfig> NodeConfig::load( const std::string &config_path )
    {
        pt::ptree tree;
        try
        {
            pt::read_json( config_path, tree );
        }
        catch ( const pt::json_parser_error &e )
        {
            base::createLogger( "NodeConfig" )->error( "Cannot read {}: {}", config_path, e.what() );
            return ConfigReaderError::PARSER_ERROR;
        }
        return fromTree( tree );
    }

    outcome::result<NodeConfig> NodeConfig::fromString( const std::string &json )
    {
        pt::ptree          tree;
        std::istringstream stream( json );
        try
        {
            pt::read_json( stream, tree );
        }
        catch ( const pt::json_parser_error &e )
        {
            return ConfigReaderError::PARSER_ERROR;
        }
        return fromTree( tree );
    }

    outcome::result<NodeConfig> NodeConfig::fromTree( const pt::ptree &tree )
    {
        NodeConfig config;
        try
        {
            OUTCOME_TRY( loadStorage( tree, config ) );
            OUTCOME_TRY( loadPersistence( tree, config ) );
            OUTCOME_TRY( loadLimits( tree, config ) );
            OUTCOME_TRY( loadLogging( tree, config ) );
        }
        catch ( const pt::ptree_bad_data &e )
        {
            return ConfigReaderError::INVALID_VALUE;
        }
        return config;
    }
}
