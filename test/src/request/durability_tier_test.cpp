#include "request/durability_tier.hpp"

#include <gtest/gtest.h>

#include "request/request_error.hpp"
#include "testutil/outcome.hpp"

using namespace reqkeep::request;

/**
 * @given text forms in any case, ordinals and an empty value
 * @when they are parsed
 * @then the matching tier is returned
 */
TEST( DurabilityTierTest, Parse )
{
    EXPECT_OUTCOME_EQ( parseDurabilityTier( "" ), DurabilityTier::CONNECTION_SCOPED );
    EXPECT_OUTCOME_EQ( parseDurabilityTier( "Connection" ), DurabilityTier::CONNECTION_SCOPED );
    EXPECT_OUTCOME_EQ( parseDurabilityTier( "REBOOT" ), DurabilityTier::REBOOT_PERSISTENT );
    EXPECT_OUTCOME_EQ( parseDurabilityTier( "forever" ), DurabilityTier::CRASH_PERSISTENT );
    EXPECT_OUTCOME_EQ( parseDurabilityTier( "1" ), DurabilityTier::REBOOT_PERSISTENT );
    EXPECT_OUTCOME_EQ( parseDurabilityTier( "2" ), DurabilityTier::CRASH_PERSISTENT );
}

/**
 * @given unknown names and ordinals
 * @when they are parsed
 * @then UNKNOWN_DURABILITY_TIER is returned
 */
TEST( DurabilityTierTest, ParseUnknown )
{
    EXPECT_OUTCOME_ERROR( parseDurabilityTier( "always" ), RequestError::UNKNOWN_DURABILITY_TIER );
    EXPECT_OUTCOME_ERROR( parseDurabilityTier( "3" ), RequestError::UNKNOWN_DURABILITY_TIER );
    EXPECT_OUTCOME_ERROR( parseDurabilityTier( "12" ), RequestError::UNKNOWN_DURABILITY_TIER );
}

/**
 * @given every tier
 * @when it is written as text and parsed back
 * @then the same tier is returned
 */
TEST( DurabilityTierTest, TextForm )
{
    EXPECT_EQ( toString( DurabilityTier::CRASH_PERSISTENT ), "forever" );
    for ( auto tier :
          { DurabilityTier::CONNECTION_SCOPED, DurabilityTier::REBOOT_PERSISTENT, DurabilityTier::CRASH_PERSISTENT } )
    {
        EXPECT_OUTCOME_EQ( parseDurabilityTier( toString( tier ) ), tier );
    }
}
