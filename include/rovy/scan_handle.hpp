#pragma once
/**
 * @file scan_handle.hpp
 * @brief Caller-owned, cancellable stream of radio advertisements.
 *
 * @details
 * The backend pushes advertisements from its own thread; the owner pulls them
 * with next(). The stream ends when its time box runs out, when stop() is
 * called, when the backend reports a failure, or when the handle is destroyed.
 * Stopping runs the stop hook exactly once (the link uses it to stop the
 * adapter scan).
 *
 * Pending events are held in a fixed-capacity ETL deque; if the owner falls
 * behind, the oldest advertisement is dropped. Advertisements repeat, so a
 * dropped one is seen again on the next beacon.
 */

#include "rovy/transport/radio_backend.hpp"

#include <etl/deque.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace rovy {

constexpr size_t SCAN_QUEUE_CAP = 64;

class ScanHandle {
public:
    using StopFn = std::function<void()>;

    /// timeout_ms <= 0 means no time box; the stream runs until stop().
    explicit ScanHandle(int timeout_ms, StopFn on_stop = StopFn{});
    ~ScanHandle();

    ScanHandle(const ScanHandle&) = delete;
    ScanHandle& operator=(const ScanHandle&) = delete;

    // --- producer side (backend thread) ---
    void push(const RadioDevice& device);
    void fail(const std::string& reason);

    // --- consumer side ---
    /// Wait up to wait_ms for the next advertisement. False once the stream is over or on timeout.
    bool next(RadioDevice& out, int wait_ms);
    void stop();

    bool finished() const;
    std::optional<std::string> error() const;
    size_t dropped() const;

private:
    void finish_locked(std::unique_lock<std::mutex>& lk);

    using Clock = std::chrono::steady_clock;

    mutable std::mutex                        mu_;
    std::condition_variable                   cv_;
    etl::deque<RadioDevice, SCAN_QUEUE_CAP>   queue_;
    std::optional<Clock::time_point>          deadline_;
    StopFn                                    on_stop_;
    std::optional<std::string>                error_;
    size_t                                    dropped_  = 0;
    bool                                      finished_ = false;
};

} // namespace rovy
