#include "request/request_identity.hpp"

#include <gtest/gtest.h>

#include "codec/codec_error.hpp"
#include "request/request_error.hpp"
#include "testutil/outcome.hpp"

using namespace reqkeep;
using namespace reqkeep::request;

/**
 * @given a shared flag together with a client name
 * @when an identity is created
 * @then INVALID_IDENTITY is returned
 */
TEST( RequestIdentityTest, SharedQueueHasNoClientName )
{
    EXPECT_OUTCOME_ERROR( RequestIdentity::create( true, std::string( "alice" ), "id", RequestKind::GET ),
                          RequestError::INVALID_IDENTITY );
    EXPECT_OUTCOME_ERROR( RequestIdentity::create( false, boost::none, "id", RequestKind::GET ),
                          RequestError::INVALID_IDENTITY );
}

/**
 * @given identities differing only in queue, identifier or kind
 * @when they are compared
 * @then they are all distinct
 */
TEST( RequestIdentityTest, AllPartsTakePartInEquality )
{
    auto base     = RequestIdentity::forClient( "alice", "id", RequestKind::GET );
    auto other    = RequestIdentity::forClient( "bob", "id", RequestKind::GET );
    auto shared   = RequestIdentity::onSharedQueue( "id", RequestKind::GET );
    auto insert   = RequestIdentity::forClient( "alice", "id", RequestKind::PUT );
    auto renamed  = RequestIdentity::forClient( "alice", "id2", RequestKind::GET );
    auto same     = RequestIdentity::forClient( "alice", "id", RequestKind::GET );

    EXPECT_EQ( base, same );
    EXPECT_NE( base, other );
    EXPECT_NE( base, shared );
    EXPECT_NE( base, insert );
    EXPECT_NE( base, renamed );
    EXPECT_TRUE( base < renamed || renamed < base );
}

/**
 * @given a client identity and a shared queue identity
 * @when they are written and read back
 * @then the identities are equal
 */
TEST( RequestIdentityTest, WriteAndRead )
{
    for ( const auto &identity : { RequestIdentity::forClient( "alice", "download-1", RequestKind::GET ),
                                   RequestIdentity::onSharedQueue( "upload-1", RequestKind::PUT ) } )
    {
        codec::ByteWriter writer;
        EXPECT_OUTCOME_TRUE_1( identity.writeTo( writer ) );
        auto              bytes = writer.release();
        codec::ByteReader reader( bytes );
        EXPECT_OUTCOME_TRUE( read, RequestIdentity::readFrom( reader ) );
        EXPECT_EQ( read, identity );
        EXPECT_OUTCOME_TRUE_1( reader.expectEnd() );
    }
}

/**
 * @given an identity whose kind ordinal is unknown
 * @when it is read
 * @then UNKNOWN_REQUEST_KIND is returned
 */
TEST( RequestIdentityTest, UnknownKind )
{
    codec::ByteWriter writer;
    writer.writeBool( true );
    EXPECT_OUTCOME_TRUE_1( writer.writeUtf( "id" ) );
    writer.writeUint16( 9 );
    auto              bytes = writer.release();
    codec::ByteReader reader( bytes );

    EXPECT_OUTCOME_ERROR( RequestIdentity::readFrom( reader ), codec::DecodeError::UNKNOWN_REQUEST_KIND );
}

/**
 * @given identities on a client queue and on the shared queue
 * @when they are formatted
 * @then the queue, identifier and kind are shown
 */
TEST( RequestIdentityTest, ToString )
{
    EXPECT_EQ( RequestIdentity::forClient( "alice", "id", RequestKind::GET ).toString(), "alice/id (get)" );
    EXPECT_EQ( RequestIdentity::onSharedQueue( "id", RequestKind::PUT ).toString(), "<shared>/id (put)" );
}
