#ifndef REQKEEP_CLOCK_CLOCK_HPP
#define REQKEEP_CLOCK_CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace reqkeep::clock
{

    /**
     * An interface for a clock
     * @tparam clock type is an underlying clock type, such as std::steady_clock
     */
    template <typename ClockType>
    class Clock
    {
    public:
        using Duration  = typename ClockType::duration;
        using TimePoint = typename ClockType::time_point;

        virtual ~Clock() = default;

        /**
         * @return a time point representing the current time
         */
        virtual TimePoint now() const = 0;

        /**
         * @return milliseconds since the clock's epoch
         */
        virtual uint64_t nowUint64() const = 0;
    };

    /**
     * Steady clock is used for measuring intervals
     */
    using SteadyClock = Clock<std::chrono::steady_clock>;

    /**
     * System clock stamps request start, completion and activity times
     */
    using SystemClock = Clock<std::chrono::system_clock>;

}

#endif // REQKEEP_CLOCK_CLOCK_HPP
