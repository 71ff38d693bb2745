#include "cli.hpp"

#include <iostream>
#include <string>

#include "clock/impl/clock_impl.hpp"
#include "persistence/request_store.hpp"
#include "storage/rocksdb/rocksdb.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( reqkeep::node, CliError, e )
{
    using E = reqkeep::node::CliError;
    switch ( e )
    {
        case E::GENERIC:
            return "Unknown error";
        case E::INVALID_ARGUMENTS:
            return "Invalid arguments";
        case E::UNKNOWN_COMMAND:
            return "Unknown command";
        case E::DATABASE_OPEN_ERROR:
            return "Could not open the request database";
        case E::BAD_RECORDS:
            return "The request database contains unreadable records";
        case E::RECORD_NOT_FOUND:
            return "No stored request with this identity";
    }
    return "Unknown CliError";
}

namespace reqkeep::node
{
    namespace
    {
        using request::RequestIdentity;
        using request::RequestKind;

        bool is_command( const std::string &command )
        {
            return command == "list" || command == "verify" || command == "remove";
        }

        std::string describe( const request::RequestRecord &record )
        {
            auto tag = record.persistentTag();
            std::string state = tag.finished ? ( tag.succeeded ? "succeeded" : "failed" )
                                             : ( tag.started ? "running" : "waiting" );
            std::string line = record.identity().toString() + " " + tag.target + " priority=" +
                               std::to_string( tag.priority_class ) + " " + state;
            if ( tag.client_token )
            {
                line += " token=" + *tag.client_token;
            }
            return line;
        }

        outcome::result<std::shared_ptr<storage::rocksdb>> open_database( const boost::program_options::variables_map &vm )
        {
            if ( vm.count( "db" ) == 0 )
            {
                std::cerr << "--db is required\n";
                return CliError::INVALID_ARGUMENTS;
            }
            storage::rocksdb::Options options;
            options.create_if_missing = false;
            auto db = storage::rocksdb::create( vm["db"].as<std::string>(), options );
            if ( !db )
            {
                std::cerr << "Cannot open " << vm["db"].as<std::string>() << ": " << db.error().message() << "\n";
                return CliError::DATABASE_OPEN_ERROR;
            }
            return db.value();
        }

        outcome::result<RequestIdentity> identity_from_options( const boost::program_options::variables_map &vm )
        {
            if ( vm.count( "id" ) == 0 )
            {
                std::cerr << "--id is required\n";
                return CliError::INVALID_ARGUMENTS;
            }
            bool shared = vm.count( "shared" ) > 0;
            boost::optional<std::string> client;
            if ( vm.count( "client" ) )
            {
                client = vm["client"].as<std::string>();
            }
            if ( shared == client.has_value() )
            {
                std::cerr << "Exactly one of --client and --shared must be given\n";
                return CliError::INVALID_ARGUMENTS;
            }
            auto kind_name = vm["kind"].as<std::string>();
            RequestKind kind;
            if ( kind_name == "get" )
            {
                kind = RequestKind::GET;
            }
            else if ( kind_name == "put" )
            {
                kind = RequestKind::PUT;
            }
            else
            {
                std::cerr << "--kind must be get or put\n";
                return CliError::INVALID_ARGUMENTS;
            }
            auto identity = RequestIdentity::create( shared, client, vm["id"].as<std::string>(), kind );
            if ( !identity )
            {
                std::cerr << identity.error().message() << "\n";
                return CliError::INVALID_ARGUMENTS;
            }
            return identity.value();
        }

        std::error_code list_or_verify( storage::BufferStorage &db, std::ostream &out, bool verbose )
        {
            auto   clock = std::make_shared<clock::SystemClockImpl>();
            size_t good  = 0;
            size_t bad   = 0;
            auto   res   = persistence::RequestStore::forEachStored(
                db, clock,
                [&]( const base::Buffer &key, const outcome::result<persistence::RequestStore::RecordPtr> &record )
                {
                    if ( record )
                    {
                        ++good;
                        if ( verbose )
                        {
                            out << describe( *record.value() ) << "\n";
                        }
                    }
                    else
                    {
                        ++bad;
                        out << "bad record " << key.toHex() << ": " << record.error().message() << "\n";
                    }
                } );
            if ( !res )
            {
                std::cerr << "Reading the database failed: " << res.error().message() << "\n";
                return res.error();
            }
            out << good << " readable, " << bad << " unreadable\n";
            if ( bad != 0 )
            {
                return CliError::BAD_RECORDS;
            }
            return {};
        }

        std::error_code remove_record( storage::BufferStorage &db, const boost::program_options::variables_map &vm, std::ostream &out )
        {
            auto identity = identity_from_options( vm );
            if ( !identity )
            {
                return identity.error();
            }
            auto key = persistence::RequestStore::recordKey( identity.value() );
            if ( !key )
            {
                return key.error();
            }
            if ( !db.contains( key.value() ) )
            {
                return CliError::RECORD_NOT_FOUND;
            }
            auto res = db.remove( key.value() );
            if ( !res )
            {
                return res.error();
            }
            out << "removed " << identity.value().toString() << "\n";
            return {};
        }
    }

    void add_inspect_options( boost::program_options::options_description &description )
    {
        // clang-format off
        description.add_options ()
            ("help,h", "Print this help")
            ("command", boost::program_options::value<std::string> (), "list, verify or remove")
            ("db", boost::program_options::value<std::string> (), "Path of the request database")
            ("id", boost::program_options::value<std::string> (), "Identifier of the request to remove")
            ("client", boost::program_options::value<std::string> (), "Client the request belongs to")
            ("shared", "Request is on the shared queue")
            ("kind", boost::program_options::value<std::string> ()->default_value ("get"), "Request kind, get or put");
        // clang-format on
    }

    std::error_code handle_inspect_options( const boost::program_options::variables_map &vm, std::ostream &out )
    {
        if ( vm.count( "command" ) == 0 )
        {
            std::cerr << "No command given\n";
            return CliError::INVALID_ARGUMENTS;
        }
        auto command = vm["command"].as<std::string>();
        if ( !is_command( command ) )
        {
            std::cerr << "Unknown command " << command << "\n";
            return CliError::UNKNOWN_COMMAND;
        }

        auto db = open_database( vm );
        if ( !db )
        {
            return db.error();
        }
        return run_inspect_command( *db.value(), command, vm, out );
    }

    std::error_code run_inspect_command( storage::BufferStorage                      &db,
                                         const std::string                           &command,
                                         const boost::program_options::variables_map &vm,
                                         std::ostream                                &out )
    {
        if ( !is_command( command ) )
        {
            return CliError::UNKNOWN_COMMAND;
        }
        if ( command == "remove" )
        {
            return remove_record( db, vm, out );
        }
        return list_or_verify( db, out, command == "list" );
    }
}
