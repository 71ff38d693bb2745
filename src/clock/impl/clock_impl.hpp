#ifndef REQKEEP_CLOCK_IMPL_CLOCK_IMPL_HPP
#define REQKEEP_CLOCK_IMPL_CLOCK_IMPL_HPP

#include "clock/clock.hpp"

namespace reqkeep::clock
{

    template <typename ClockType>
    class ClockImpl : public Clock<ClockType>
    {
    public:
        typename Clock<ClockType>::TimePoint now() const override;
        uint64_t                             nowUint64() const override;
    };

    // aliases for implementations
    using SteadyClockImpl = ClockImpl<std::chrono::steady_clock>;
    using SystemClockImpl = ClockImpl<std::chrono::system_clock>;

}

#endif // REQKEEP_CLOCK_IMPL_CLOCK_IMPL_HPP
