#include <iostream>

#include <boost/program_options.hpp>

#include "base/logger.hpp"
#include "cli.hpp"

int main( int argc, char *const *argv )
{
    boost::program_options::options_description description( "Request store inspection options" );
    reqkeep::node::add_inspect_options( description );

    boost::program_options::positional_options_description positional;
    positional.add( "command", 1 );

    boost::program_options::variables_map vm;
    try
    {
        boost::program_options::store(
            boost::program_options::command_line_parser( argc, argv ).options( description ).positional( positional ).run(), vm );
        boost::program_options::notify( vm );
    }
    catch ( const boost::program_options::error &err )
    {
        std::cerr << err.what() << std::endl;
        return 1;
    }

    if ( vm.count( "help" ) )
    {
        std::cout << description << std::endl;
        return 0;
    }

    reqkeep::base::LoggingConfig logging;
    logging.level = spdlog::level::warn;
    reqkeep::base::configureLogging( logging );

    auto ec = reqkeep::node::handle_inspect_options( vm, std::cout );
    if ( ec )
    {
        std::cerr << ec.message() << std::endl;
        return 1;
    }
    return 0;
}
