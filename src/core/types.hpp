#pragma once

#include <atomic>
#include <chrono>
#include <compare>
#include <cstdint>

namespace sparkle {

/**
 * Timestamp - Represents a point in time.
 *
 * Stored as milliseconds since Unix epoch for SQLite compatibility.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t millis_;
};

/**
 * Clock - Source of the current time for the data layer.
 */
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override { return Timestamp::now(); }
};

/**
 * ManualClock - Clock that only moves when told to (tests, imports).
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp(1'700'000'000'000)) : millis_(start.millis()) {}

    [[nodiscard]] Timestamp now() const override { return Timestamp(millis_.load()); }

    void set(Timestamp t) { millis_.store(t.millis()); }
    void advance(Timestamp::Duration d) { millis_.fetch_add(d.count()); }

private:
    std::atomic<int64_t> millis_;
};

} // namespace sparkle
