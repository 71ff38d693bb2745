#include "node/cli.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "persistence/request_store.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/outcome.hpp"
#include "testutil/request_fixture.hpp"

using namespace reqkeep;
using namespace reqkeep::request;
using reqkeep::node::CliError;
using reqkeep::persistence::RequestStore;

class InspectCommandTest : public test::RequestFixture
{
public:
    void SetUp() override
    {
        RequestFixture::SetUp();
        db = std::make_shared<storage::InMemoryStorage>();
    }

    /// Stores two fetches of alice, the second one finished
    void storeRequests()
    {
        first  = persistentFetch( "alice", "download-1" );
        second = persistentFetch( "alice", "download-2" );
        second->onSuccess( ctx );
        RequestStore store( db, persistent_root );
        EXPECT_OUTCOME_TRUE_1( store.checkpoint( false ) );
    }

    static boost::program_options::variables_map options( const std::vector<std::string> &args )
    {
        boost::program_options::options_description description;
        node::add_inspect_options( description );
        boost::program_options::variables_map vm;
        boost::program_options::store( boost::program_options::command_line_parser( args ).options( description ).run(),
                                       vm );
        boost::program_options::notify( vm );
        return vm;
    }

    std::error_code run( const std::string &command, const std::vector<std::string> &args = {} )
    {
        out.str( "" );
        return node::run_inspect_command( *db, command, options( args ), out );
    }

    std::shared_ptr<storage::InMemoryStorage> db;
    RequestRecord::Ptr                        first;
    RequestRecord::Ptr                        second;
    std::ostringstream                        out;
};

/**
 * @given a store holding two readable records
 * @when list and verify are run
 * @then both succeed, list names every request and both count two readable records
 */
TEST_F( InspectCommandTest, ListAndVerify )
{
    storeRequests();

    EXPECT_FALSE( run( "list" ) );
    auto listing = out.str();
    EXPECT_NE( listing.find( first->identity().toString() ), std::string::npos ) << listing;
    EXPECT_NE( listing.find( second->identity().toString() + " CHK@target priority=" ), std::string::npos )
        << listing;
    EXPECT_NE( listing.find( "succeeded" ), std::string::npos ) << listing;
    EXPECT_NE( listing.find( "2 readable, 0 unreadable" ), std::string::npos ) << listing;

    EXPECT_FALSE( run( "verify" ) );
    EXPECT_EQ( out.str(), "2 readable, 0 unreadable\n" );
}

/**
 * @given a store where one record has a flipped byte
 * @when verify is run
 * @then BAD_RECORDS is returned and the bad record is reported
 */
TEST_F( InspectCommandTest, VerifyReportsBadRecords )
{
    storeRequests();
    EXPECT_OUTCOME_TRUE( key, RequestStore::recordKey( first->identity() ) );
    EXPECT_OUTCOME_TRUE( value, db->get( key ) );
    value[12] ^= 0x40;
    EXPECT_OUTCOME_TRUE_1( db->put( key, value ) );

    EXPECT_EQ( run( "verify" ), make_error_code( CliError::BAD_RECORDS ) );
    EXPECT_NE( out.str().find( "bad record " + key.toHex() ), std::string::npos ) << out.str();
    EXPECT_NE( out.str().find( "1 readable, 1 unreadable" ), std::string::npos ) << out.str();
}

/**
 * @given a store holding two records
 * @when remove is run for a stored identity and then again for the same identity
 * @then the record is deleted once and the second run returns RECORD_NOT_FOUND
 */
TEST_F( InspectCommandTest, Remove )
{
    storeRequests();
    EXPECT_OUTCOME_TRUE( key, RequestStore::recordKey( first->identity() ) );
    std::vector<std::string> args{ "--client", "alice", "--id", "download-1" };

    EXPECT_FALSE( run( "remove", args ) );
    EXPECT_FALSE( db->contains( key ) );
    EXPECT_EQ( db->size(), 1u );

    EXPECT_EQ( run( "remove", args ), make_error_code( CliError::RECORD_NOT_FOUND ) );
    EXPECT_EQ( db->size(), 1u );
}

/**
 * @given remove without a client or with both a client and the shared flag
 * @when it is run
 * @then INVALID_ARGUMENTS is returned and nothing is deleted
 */
TEST_F( InspectCommandTest, RemoveNeedsOneOwner )
{
    storeRequests();

    EXPECT_EQ( run( "remove", { "--id", "download-1" } ), make_error_code( CliError::INVALID_ARGUMENTS ) );
    EXPECT_EQ( run( "remove", { "--client", "alice", "--shared", "--id", "download-1" } ),
               make_error_code( CliError::INVALID_ARGUMENTS ) );
    EXPECT_EQ( db->size(), 2u );
}

/**
 * @given an unknown command
 * @when it is run
 * @then UNKNOWN_COMMAND is returned
 */
TEST_F( InspectCommandTest, UnknownCommand )
{
    EXPECT_EQ( run( "compact" ), make_error_code( CliError::UNKNOWN_COMMAND ) );
}
