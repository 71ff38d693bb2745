#include "codec/checksum_checker.hpp"

#include <gtest/gtest.h>

#include "codec/codec_error.hpp"
#include "testutil/outcome.hpp"

using namespace reqkeep;
using reqkeep::codec::ChecksumChecker;
using reqkeep::codec::DecodeError;

/**
 * @given the ASCII digits 1 to 9
 * @when the checksum is computed
 * @then it is the standard CRC-32 check value
 */
TEST( ChecksumCheckerTest, StandardCheckValue )
{
    auto digits = base::Buffer::fromString( "123456789" );
    EXPECT_EQ( ChecksumChecker::checksum( digits.data(), digits.size() ), 0xCBF43926u );
}

/**
 * @given a payload framed with its checksum
 * @when it is verified
 * @then the original payload is returned
 */
TEST( ChecksumCheckerTest, StripsValidChecksum )
{
    auto payload = base::Buffer::fromString( "record body" );
    auto framed  = ChecksumChecker::appendChecksum( payload );
    ASSERT_EQ( framed.size(), payload.size() + ChecksumChecker::kChecksumLength );

    EXPECT_OUTCOME_EQ( ChecksumChecker::verifyAndStrip( framed ), payload );
}

/**
 * @given a framed payload with one flipped bit
 * @when it is verified
 * @then CHECKSUM_MISMATCH is returned
 */
TEST( ChecksumCheckerTest, DetectsFlippedBit )
{
    auto framed = ChecksumChecker::appendChecksum( base::Buffer::fromString( "record body" ) );
    framed[3] ^= 0x10;

    EXPECT_OUTCOME_ERROR( ChecksumChecker::verifyAndStrip( framed ), DecodeError::CHECKSUM_MISMATCH );
}

/**
 * @given a value shorter than a checksum
 * @when it is verified
 * @then NOT_ENOUGH_DATA is returned
 */
TEST( ChecksumCheckerTest, TooShort )
{
    base::Buffer framed{ 0x01, 0x02 };
    EXPECT_OUTCOME_ERROR( ChecksumChecker::verifyAndStrip( framed ), DecodeError::NOT_ENOUGH_DATA );
}
