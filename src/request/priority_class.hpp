#ifndef REQKEEP_REQUEST_PRIORITY_CLASS_HPP
#define REQKEEP_REQUEST_PRIORITY_CLASS_HPP

#include <cstdint>

namespace reqkeep::request
{
    /// Scheduling priority of a request, lower values run first
    using PriorityClass = int16_t;

    namespace priority
    {
        constexpr PriorityClass kMaximum            = 0;
        constexpr PriorityClass kInteractive        = 1;
        constexpr PriorityClass kImmediateSplitfile = 2;
        constexpr PriorityClass kUpdate             = 3;
        constexpr PriorityClass kBulkSplitfile      = 4;
        constexpr PriorityClass kPrefetch           = 5;
        /// Requests at this class are not scheduled at all
        constexpr PriorityClass kPaused             = 6;
        constexpr PriorityClass kMinimum            = kPaused;

        constexpr bool isValid( PriorityClass value )
        {
            return value >= kMaximum && value <= kMinimum;
        }
    }
}

#endif // REQKEEP_REQUEST_PRIORITY_CLASS_HPP
