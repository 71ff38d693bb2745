#ifndef REQKEEP_NODE_CLI_HPP
#define REQKEEP_NODE_CLI_HPP

#include <ostream>
#include <string>
#include <system_error>

#include <boost/program_options.hpp>

#include "outcome/outcome.hpp"
#include "storage/buffer_map_types.hpp"

namespace reqkeep::node
{
    /** Command line related error codes */
    enum class CliError
    {
        GENERIC = 1,
        INVALID_ARGUMENTS,
        UNKNOWN_COMMAND,
        DATABASE_OPEN_ERROR,
        BAD_RECORDS,
        RECORD_NOT_FOUND,
    };

    void add_inspect_options( boost::program_options::options_description &description );

    /**
     * @brief Runs the command selected by "command" against the request
     * store named by "db"
     * @param out - stream receiving the report
     */
    std::error_code handle_inspect_options( const boost::program_options::variables_map &vm, std::ostream &out );

    /**
     * @brief Runs list, verify or remove against an open request store
     * @return BAD_RECORDS if verify finds unreadable records,
     * RECORD_NOT_FOUND if remove finds nothing to remove
     */
    std::error_code run_inspect_command( storage::BufferStorage                      &db,
                                         const std::string                           &command,
                                         const boost::program_options::variables_map &vm,
                                         std::ostream                                &out );
}

OUTCOME_HPP_DECLARE_ERROR_2( reqkeep::node, CliError );

#endif // REQKEEP_NODE_CLI_HPP
