#pragma once

#include <chrono>
#include <cstdint>
#include <compare>

namespace nom {

/**
 * ItemId - Engine-assigned item identifier. Valid identifiers start at 1.
 */
using ItemId = int64_t;

/**
 * Timestamp - A point in time, stored as milliseconds since the Unix epoch.
 *
 * The epoch itself is the "unset" value: an item whose read_at is zero
 * is unread.
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

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return millis_ == 0;
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(millis_ - d.count());
    }

private:
    int64_t millis_;
};

} // namespace nom
