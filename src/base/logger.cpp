#include "base/logger.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    std::mutex                   config_mutex;
    reqkeep::base::LoggingConfig active_config;

    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    void setDebugPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S.%F][th:%t][%l][%n] %v" );
    }

    void applyConfig( spdlog::logger &logger, const reqkeep::base::LoggingConfig &config )
    {
        if ( config.debug_pattern )
        {
            setDebugPattern( logger );
        }
        else
        {
            setGlobalPattern( logger );
        }
        logger.set_level( config.level );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag, const reqkeep::base::LoggingConfig &config )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( !config.file.empty() )
        {
            logger = spdlog::basic_logger_mt( tag, config.file );
        }
        else
        {
            logger = spdlog::stdout_color_mt( tag );
        }
        applyConfig( *logger, config );
        return logger;
    }
} // namespace

namespace reqkeep::base
{
    void configureLogging( const LoggingConfig &config )
    {
        std::lock_guard<std::mutex> lock( config_mutex );
        active_config = config;
        spdlog::set_level( config.level );
        spdlog::apply_all( [&config]( const std::shared_ptr<spdlog::logger> &logger ) { applyConfig( *logger, config ); } );
    }

    Logger createLogger( const std::string &tag )
    {
        std::lock_guard<std::mutex> lock( config_mutex );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, active_config );
        }
        return logger;
    }
}
