#ifndef REQKEEP_REQUEST_DURABILITY_TIER_HPP
#define REQKEEP_REQUEST_DURABILITY_TIER_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "outcome/outcome.hpp"

namespace reqkeep::request
{
    /**
     * Whether and how a request survives the loss of its session or a
     * process restart
     */
    enum class DurabilityTier : uint8_t
    {
        CONNECTION_SCOPED = 0, ///< dies with the originating session
        REBOOT_PERSISTENT = 1, ///< survives session loss, not a restart
        CRASH_PERSISTENT  = 2, ///< checkpointed and resumed after a restart
    };

    /**
     * @return "connection", "reboot" or "forever"
     */
    std::string toString( DurabilityTier tier );

    /**
     * Parse a durability tier from its text form or ordinal. An empty value
     * means connection scoped.
     */
    outcome::result<DurabilityTier> parseDurabilityTier( std::string_view text );

    inline std::ostream &operator<<( std::ostream &out, DurabilityTier tier )
    {
        return out << toString( tier );
    }
}

#endif // REQKEEP_REQUEST_DURABILITY_TIER_HPP
