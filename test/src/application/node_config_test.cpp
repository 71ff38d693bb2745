#include "application/node_config.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>

#include "application/impl/config_reader/error.hpp"
#include "testutil/outcome.hpp"

using reqkeep::application::ConfigReaderError;
using reqkeep::application::NodeConfig;

/**
 * @given a config naming only the database path
 * @when it is parsed
 * @then every other field has its default
 */
TEST( NodeConfigTest, Defaults )
{
    EXPECT_OUTCOME_TRUE( config, NodeConfig::fromString( R"({"storage": {"path": "/var/lib/reqkeep"}})" ) );

    EXPECT_EQ( config.storage_backend, NodeConfig::StorageBackend::ROCKSDB );
    EXPECT_EQ( config.storage_path, "/var/lib/reqkeep" );
    EXPECT_TRUE( config.persistence_enabled );
    EXPECT_EQ( config.checkpoint_interval, std::chrono::minutes( 10 ) );
    EXPECT_EQ( config.executor_threads, 4u );
    EXPECT_EQ( config.max_unacknowledged_finished, 1000u );
    EXPECT_EQ( config.logging.level, spdlog::level::info );
    EXPECT_TRUE( config.logging.file.empty() );
}

/**
 * @given a config with every section set
 * @when it is parsed
 * @then every value is taken over
 */
TEST( NodeConfigTest, AllSections )
{
    EXPECT_OUTCOME_TRUE( config, NodeConfig::fromString( R"({
        "storage": {"backend": "Memory"},
        "persistence": {"enabled": false, "checkpoint_interval_ms": 250},
        "executor": {"threads": 2},
        "clients": {"max_unacknowledged_finished": 5},
        "logging": {"level": "debug", "file": "node.log"}
    })" ) );

    EXPECT_EQ( config.storage_backend, NodeConfig::StorageBackend::MEMORY );
    EXPECT_FALSE( config.persistence_enabled );
    EXPECT_EQ( config.checkpoint_interval, std::chrono::milliseconds( 250 ) );
    EXPECT_EQ( config.executor_threads, 2u );
    EXPECT_EQ( config.max_unacknowledged_finished, 5u );
    EXPECT_EQ( config.logging.level, spdlog::level::debug );
    EXPECT_EQ( config.logging.file, "node.log" );
    EXPECT_TRUE( config.logging.debug_pattern );
}

/**
 * @given a rocksdb config without a path
 * @when it is parsed
 * @then MISSING_ENTRY is returned
 */
TEST( NodeConfigTest, MissingPath )
{
    EXPECT_OUTCOME_ERROR( NodeConfig::fromString( R"({"storage": {"backend": "rocksdb"}})" ),
                          ConfigReaderError::MISSING_ENTRY );
}

/**
 * @given configs with values out of range or of the wrong type
 * @when they are parsed
 * @then INVALID_VALUE is returned
 */
TEST( NodeConfigTest, InvalidValues )
{
    const char *configs[] = {
        R"({"storage": {"backend": "tape"}})",
        R"({"storage": {"backend": "rocksdb", "path": ""}})",
        R"({"storage": {"backend": "memory"}, "persistence": {"checkpoint_interval_ms": 0}})",
        R"({"storage": {"backend": "memory"}, "executor": {"threads": -1}})",
        R"({"storage": {"backend": "memory"}, "executor": {"threads": "many"}})",
        R"({"storage": {"backend": "memory"}, "clients": {"max_unacknowledged_finished": -5}})",
        R"({"storage": {"backend": "memory"}, "clients": {"max_unacknowledged_finished": 0}})",
        R"({"storage": {"backend": "memory"}, "logging": {"level": "chatty"}})",
    };
    for ( const auto *json : configs )
    {
        auto config = NodeConfig::fromString( json );
        ASSERT_FALSE( config ) << json;
        EXPECT_EQ( config.error(), ConfigReaderError::INVALID_VALUE ) << json;
    }
}

/**
 * @given malformed JSON and a missing file
 * @when they are parsed
 * @then PARSER_ERROR is returned
 */
TEST( NodeConfigTest, ParserError )
{
    EXPECT_OUTCOME_ERROR( NodeConfig::fromString( R"({"storage": )" ), ConfigReaderError::PARSER_ERROR );
    EXPECT_OUTCOME_ERROR( NodeConfig::load( "/nonexistent/reqkeep.json" ), ConfigReaderError::PARSER_ERROR );
}

/**
 * @given a config file on disk
 * @when it is loaded
 * @then its values are returned
 */
TEST( NodeConfigTest, LoadFile )
{
    auto path = boost::filesystem::temp_directory_path() / "reqkeep_node_config_test.json";
    {
        std::ofstream file( path.string() );
        file << R"({"storage": {"backend": "memory"}, "logging": {"level": "warn"}})";
    }

    auto config = NodeConfig::load( path.string() );
    boost::filesystem::remove( path );

    ASSERT_TRUE( config ) << config.error().message();
    EXPECT_EQ( config.value().storage_backend, NodeConfig::StorageBackend::MEMORY );
    EXPECT_EQ( config.value().logging.level, spdlog::level::warn );
    EXPECT_FALSE( config.value().logging.debug_pattern );
}
