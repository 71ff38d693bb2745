#ifndef REQKEEP_TEST_MOCK_CLOCK_CLOCK_MOCK_HPP
#define REQKEEP_TEST_MOCK_CLOCK_CLOCK_MOCK_HPP

#include "clock/clock.hpp"

#include <atomic>

#include <gmock/gmock.h>

namespace reqkeep::clock
{
    class SystemClockMock : public SystemClock
    {
    public:
        MOCK_CONST_METHOD0( now, SystemClock::TimePoint() );
        MOCK_CONST_METHOD0( nowUint64, uint64_t() );
    };

    /// Clock that only moves when told to
    class ManualClock : public SystemClock
    {
    public:
        explicit ManualClock( uint64_t start = 1000 ) : now_( start )
        {
        }

        SystemClock::TimePoint now() const override
        {
            return SystemClock::TimePoint( std::chrono::milliseconds( now_.load() ) );
        }

        uint64_t nowUint64() const override
        {
            return now_.load();
        }

        void advance( uint64_t millis )
        {
            now_ += millis;
        }

    private:
        std::atomic<uint64_t> now_;
    };
}

#endif // REQKEEP_TEST_MOCK_CLOCK_CLOCK_MOCK_HPP
