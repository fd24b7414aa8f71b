// tests/test_support/TestClock.h
#pragma once

#include <memory>

#include "eldritch/core/Time.h"

namespace eldritch::test {

// Fixed epoch used by every test: 2024-01-01T00:00:00Z.
inline TimePoint Epoch()
{
    return TimePoint(Seconds(1704067200));
}

// Manually advanced clock. Copies share the same current time, so one can
// be handed to a manager as an eldritch::Clock and still be advanced here.
class TestClock
{
public:
    explicit TestClock(TimePoint start = Epoch()) : now_(std::make_shared<TimePoint>(start)) {}

    TimePoint now() const { return *now_; }
    void advance(Seconds d) { *now_ += d; }
    void set(TimePoint t) { *now_ = t; }

    Clock source() const
    {
        auto shared = now_;
        return [shared] { return *shared; };
    }

private:
    std::shared_ptr<TimePoint> now_;
};

} // namespace eldritch::test
