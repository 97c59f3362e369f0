#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace tracemark
{

// Restart-on-request delayed task. Every request() pushes the deadline out to
// now + delay; poll() runs the callback once the deadline has passed, so a burst of
// requests collapses into a single redraw.
class RedrawDebouncer
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = Clock::duration;
    using Callback  = std::function<void()>;

    explicit RedrawDebouncer(Duration delay = std::chrono::milliseconds(10));

    void     set_delay(Duration delay) { delay_ = delay; }
    Duration delay() const { return delay_; }

    void set_callback(Callback cb) { callback_ = std::move(cb); }

    void request(TimePoint now);
    void request() { request(Clock::now()); }

    // Fires the callback if the quiet period has elapsed. Returns true if it fired.
    bool poll(TimePoint now);
    bool poll() { return poll(Clock::now()); }

    void cancel() { deadline_.reset(); }

    bool                     pending() const { return deadline_.has_value(); }
    std::optional<TimePoint> deadline() const { return deadline_; }

    uint64_t request_count() const { return requests_; }
    uint64_t fire_count() const { return fires_; }

   private:
    Duration                 delay_;
    Callback                 callback_;
    std::optional<TimePoint> deadline_;
    uint64_t                 requests_ = 0;
    uint64_t                 fires_    = 0;
};

}   // namespace tracemark
