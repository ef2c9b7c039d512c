#pragma once
#include "result.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Cooperative cancellation shared between the caller and a running operation.
// Copies refer to the same state. Nothing is interrupted: workers poll
// isCancelled() before each unit of work.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken();

    static CancellationToken withDeadline(Clock::time_point deadline);
    static CancellationToken withTimeout(Clock::duration timeout);

    void cancel(const std::string& reason = "cancelled");
    bool isCancelled() const;

    // error describing why the token fired; empty while it has not
    std::optional<SyncError> reason() const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
        mutable std::mutex mtx;
        std::string reason;
    };

    std::shared_ptr<State> state_;
};
