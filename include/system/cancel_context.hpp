#pragma once

#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string_view>

namespace migfetch {

// Cancellation signal handed to every network and subprocess call. Cancelled
// either explicitly (signal handler, caller) or by passing its deadline.
class CancelContext {
  public:
    using Clock = std::chrono::steady_clock;

    CancelContext() = default;
    explicit CancelContext(Clock::time_point deadline) : deadline_(deadline) {}

    CancelContext(const CancelContext&) = delete;
    CancelContext& operator=(const CancelContext&) = delete;

    static CancelContext WithTimeout(std::chrono::milliseconds timeout) {
        return CancelContext(Clock::now() + timeout);
    }

    // Async-signal-safe.
    void Cancel() { cancelled_.store(true, std::memory_order_relaxed); }

    bool IsCancelled() const {
        if (cancelled_.load(std::memory_order_relaxed)) return true;
        return deadline_ && Clock::now() >= *deadline_;
    }

    // Time left before the deadline, nullopt when there is none.
    std::optional<std::chrono::milliseconds> Remaining() const {
        if (!deadline_) return std::nullopt;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    Result Check(std::string_view what) const {
        if (!IsCancelled()) return Result::Ok();
        return Result::Fail(ErrorKind::Cancelled, std::string(what) + ": operation cancelled");
    }

  private:
    std::atomic_bool cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace migfetch
