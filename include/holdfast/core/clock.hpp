#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace holdfast {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Wall-clock source injected into every time-dependent component
 *
 * Window expiry, cache expiry and queue timestamps all read time through
 * this interface so tests can move time explicitly.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{std::chrono::seconds(1704067200)})
        : now_(start) {}

    TimePoint now() const override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void set(TimePoint value) {
        std::lock_guard lock(mutex_);
        now_ = value;
    }

    template<typename Rep, typename Period>
    void advance(const std::chrono::duration<Rep, Period>& delta) {
        std::lock_guard lock(mutex_);
        now_ += std::chrono::duration_cast<TimePoint::duration>(delta);
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

// Persisted timestamps are milliseconds since the Unix epoch.
inline std::int64_t to_millis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

// Largest timestamp a decoder accepts. Half the TimePoint range, so that the
// difference between any accepted timestamp and the current time fits in
// TimePoint::duration.
inline constexpr std::int64_t kMaxPersistedMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max()).count() / 2;

inline bool persisted_millis_in_range(std::int64_t millis) {
    return millis >= 0 && millis <= kMaxPersistedMillis;
}

/// Caller checks persisted_millis_in_range() for values read from storage
inline TimePoint from_millis(std::int64_t millis) {
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis))};
}

} // namespace holdfast
