#include "request/durability_tier.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include "request/request_error.hpp"

namespace reqkeep::request
{
    std::string toString( DurabilityTier tier )
    {
        switch ( tier )
        {
            case DurabilityTier::CONNECTION_SCOPED:
                return "connection";
            case DurabilityTier::REBOOT_PERSISTENT:
                return "reboot";
            case DurabilityTier::CRASH_PERSISTENT:
                return "forever";
        }
        return std::to_string( static_cast<int>( tier ) );
    }

    outcome::result<DurabilityTier> parseDurabilityTier( std::string_view text )
    {
        if ( text.empty() || boost::algorithm::iequals( text, "connection" ) )
        {
            return DurabilityTier::CONNECTION_SCOPED;
        }
        if ( boost::algorithm::iequals( text, "reboot" ) )
        {
            return DurabilityTier::REBOOT_PERSISTENT;
        }
        if ( boost::algorithm::iequals( text, "forever" ) )
        {
            return DurabilityTier::CRASH_PERSISTENT;
        }
        if ( text.size() == 1 && text[0] >= '0' && text[0] <= '2' )
        {
            return static_cast<DurabilityTier>( text[0] - '0' );
        }
        return RequestError::UNKNOWN_DURABILITY_TIER;
    }
}
