#include "cancellation.hpp"

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken CancellationToken::withDeadline(Clock::time_point deadline) {
    CancellationToken token;
    token.state_->deadline = deadline;
    return token;
}

CancellationToken CancellationToken::withTimeout(Clock::duration timeout) {
    return withDeadline(Clock::now() + timeout);
}

void CancellationToken::cancel(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_->mtx);
    if (state_->cancelled.load()) return;   // first reason wins
    state_->reason = reason;
    state_->cancelled.store(true);
}

bool CancellationToken::isCancelled() const {
    if (state_->cancelled.load()) return true;
    return state_->deadline.has_value() && Clock::now() >= *state_->deadline;
}

std::optional<SyncError> CancellationToken::reason() const {
    if (state_->cancelled.load()) {
        std::lock_guard<std::mutex> lock(state_->mtx);
        return SyncError(ErrorCode::Cancelled, state_->reason);
    }
    if (state_->deadline.has_value() && Clock::now() >= *state_->deadline) {
        return SyncError(ErrorCode::DeadlineExceeded, "deadline exceeded");
    }
    return std::nullopt;
}
