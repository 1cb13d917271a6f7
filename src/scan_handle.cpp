// ============================================================================
// scan_handle.cpp — implementation for scan_handle.hpp
// ============================================================================

#include "rovy/scan_handle.hpp"
#include "rovy/log.hpp"

namespace rovy {

ScanHandle::ScanHandle(int timeout_ms, StopFn on_stop)
: on_stop_(std::move(on_stop)) {
    if (timeout_ms > 0) deadline_ = Clock::now() + std::chrono::milliseconds(timeout_ms);
}

ScanHandle::~ScanHandle() {
    stop();
}

void ScanHandle::push(const RadioDevice& device) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (finished_) return;              // late event after stop
        if (queue_.full()) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(device);
    }
    cv_.notify_one();
}

void ScanHandle::fail(const std::string& reason) {
    std::unique_lock<std::mutex> lk(mu_);
    if (finished_) return;
    error_ = reason;
    log_error("scan", "scan failed: " + reason);
    finish_locked(lk);
}

// Marks the stream over and runs the stop hook outside the lock, since the
// hook calls into the backend which may push() concurrently.
void ScanHandle::finish_locked(std::unique_lock<std::mutex>& lk) {
    finished_ = true;
    StopFn hook = std::move(on_stop_);
    on_stop_ = StopFn{};
    lk.unlock();
    cv_.notify_all();
    if (hook) hook();
}

bool ScanHandle::next(RadioDevice& out, int wait_ms) {
    std::unique_lock<std::mutex> lk(mu_);

    Clock::time_point until = Clock::now() + std::chrono::milliseconds(wait_ms > 0 ? wait_ms : 0);
    if (deadline_ && *deadline_ < until) until = *deadline_;

    cv_.wait_until(lk, until, [this] { return !queue_.empty() || finished_; });

    if (!queue_.empty()) {
        out = queue_.front();
        queue_.pop_front();
        return true;
    }
    if (!finished_ && deadline_ && Clock::now() >= *deadline_) {
        finish_locked(lk);                  // time box over
    }
    return false;
}

void ScanHandle::stop() {
    std::unique_lock<std::mutex> lk(mu_);
    if (finished_) return;
    finish_locked(lk);
}

bool ScanHandle::finished() const {
    std::lock_guard<std::mutex> lk(mu_);
    return finished_ && queue_.empty();
}

std::optional<std::string> ScanHandle::error() const {
    std::lock_guard<std::mutex> lk(mu_);
    return error_;
}

size_t ScanHandle::dropped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
}

} // namespace rovy
