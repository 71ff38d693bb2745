#ifndef REQKEEP_BASE_LOGGER_HPP
#define REQKEEP_BASE_LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace reqkeep::base
{
    using Logger = std::shared_ptr<spdlog::logger>;

    /**
     * Process-wide logging setup, applied once at start-up
     */
    struct LoggingConfig
    {
        spdlog::level::level_enum level = spdlog::level::info;
        /// Empty for console output
        std::string file;
        bool        debug_pattern = false;
    };

    /**
     * Apply the logging setup to every logger created so far and to all loggers
     * created afterwards
     * @param config - level, sink and pattern selection
     */
    void configureLogging( const LoggingConfig &config );

    /**
     * Provide logger object
     * @param tag - tagging name for identifying logger
     * @return logger object
     */
    Logger createLogger( const std::string &tag );
}

#endif // REQKEEP_BASE_LOGGER_HPP
