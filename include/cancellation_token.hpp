#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>

// Thrown from inside per-file work once its token fires. The file is
// abandoned, not degraded.
class AnalysisCancelled : public std::runtime_error {
public:
    AnalysisCancelled() : std::runtime_error("analysis cancelled") {}
};

// Cancellation signal shared between the caller and a running pipeline.
// Copies share the same flag.
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    explicit CancellationToken(std::chrono::steady_clock::time_point deadline)
        : cancelled_(std::make_shared<std::atomic<bool>>(false)), deadline_(deadline) {}

    void cancel() { cancelled_->store(true); }

    // True once cancel() was called or the deadline has passed
    bool isCancelled() const {
        if (cancelled_->load()) {
            return true;
        }
        return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
    }

    void throwIfCancelled() const {
        if (isCancelled()) {
            throw AnalysisCancelled();
        }
    }

    // Time left before the deadline, empty when there is none
    std::optional<std::chrono::microseconds> remaining() const {
        if (!deadline_) {
            return std::nullopt;
        }
        auto left = std::chrono::duration_cast<std::chrono::microseconds>(*deadline_ - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::microseconds(0));
    }

    // Earliest of this token's deadline and the given one
    CancellationToken withDeadline(std::chrono::steady_clock::time_point deadline) const {
        CancellationToken token(*this);
        if (!token.deadline_ || deadline < *token.deadline_) {
            token.deadline_ = deadline;
        }
        return token;
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};
