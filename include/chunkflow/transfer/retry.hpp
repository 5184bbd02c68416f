#pragma once

#include "chunkflow/core/result.hpp"
#include "chunkflow/transfer/transport.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace chunkflow::transfer {

class ProgressTracker;

/// Per-item state visible to each attempt. Lives for one item only.
struct AttemptContext {
    int attempt = 0;
    bool checksum_deploy_fallback = false;
};

enum class AttemptStatus {
    Success,
    Retryable,         ///< Connection error or 5xx
    ChecksumRejected,  ///< Store refused the integrity header; retryable with the fallback header
    HardFailure        ///< Any other status; not retried
};

const char* to_string(AttemptStatus status);

struct AttemptResult {
    AttemptStatus status = AttemptStatus::HardFailure;
    int status_code = 0;
    std::string error;

    static AttemptResult success(int status_code = 200) {
        return {AttemptStatus::Success, status_code, {}};
    }
    static AttemptResult retryable(std::string error, int status_code = 0) {
        return {AttemptStatus::Retryable, status_code, std::move(error)};
    }
    static AttemptResult checksum_rejected(std::string error, int status_code) {
        return {AttemptStatus::ChecksumRejected, status_code, std::move(error)};
    }
    static AttemptResult hard_failure(std::string error, int status_code) {
        return {AttemptStatus::HardFailure, status_code, std::move(error)};
    }
};

/**
 * @brief Map a transport reply onto the retry state machine
 *
 * 200/201 succeed. A body mentioning "checksum" (any case) is a checksum
 * rejection, 5xx and connection errors are retryable, anything else is hard.
 */
AttemptResult classify_response(const Result<TransportResponse>& response);

using Sleeper = std::function<void(std::chrono::duration<double>)>;

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::duration<double> backoff_base{1.0};
    Sleeper sleeper;  ///< Empty means std::this_thread::sleep_for
};

enum class RetryState {
    Succeeded,
    Exhausted,
    Rejected
};

const char* to_string(RetryState state);

struct RetryResult {
    RetryState state = RetryState::Exhausted;
    int attempts = 0;
    std::string last_error;
    int last_status = 0;

    [[nodiscard]] bool succeeded() const noexcept { return state == RetryState::Succeeded; }
};

/**
 * @brief Bounded retry loop with exponential backoff around one attempt
 *
 * Attempting(n), n in [0, max_retries): Success ends in Succeeded,
 * HardFailure ends in Rejected, anything else sleeps backoff_base * 2^n and
 * moves to Attempting(n+1), or ends in Exhausted after the last attempt
 * (no sleep follows the last attempt). A ChecksumRejected reply turns on
 * AttemptContext::checksum_deploy_fallback for the rest of this call.
 */
class RetryingTransport {
public:
    using Operation = std::function<AttemptResult(AttemptContext&)>;

    explicit RetryingTransport(RetryPolicy policy = {});

    /// @p progress, when given, is reset before every retry so a re-read starts from zero.
    RetryResult attempt(const std::string& label, const Operation& op, ProgressTracker* progress = nullptr) const;

    [[nodiscard]] std::chrono::duration<double> backoff_for(int attempt) const;
    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    void sleep(std::chrono::duration<double> delay) const;

    RetryPolicy policy_;
};

} // namespace chunkflow::transfer
