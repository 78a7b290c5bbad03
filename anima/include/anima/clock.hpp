#pragma once
// Clock: where "now" comes from
//
// Production uses the wall clock. Tests drive a ManualClock so stall
// windows and cadences can be crossed without sleeping.

#include <anima/types.hpp>
#include <atomic>

namespace anima {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override { return anima::now(); }
};

class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 1760000000000) : now_(start) {}

    Timestamp now() const override { return now_.load(); }

    void set(Timestamp t) { now_ = t; }
    void advance(int64_t ms) { now_ += ms; }

private:
    std::atomic<Timestamp> now_;
};

} // namespace anima
