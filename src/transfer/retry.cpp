#include "chunkflow/transfer/retry.hpp"
#include "chunkflow/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <thread>

namespace chunkflow::transfer {

namespace {

bool mentions_checksum(const std::string& body) {
    std::string lowered(body);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("checksum") != std::string::npos;
}

std::string describe_status(const TransportResponse& response) {
    std::string text = "HTTP " + std::to_string(response.status_code);
    if (!response.body.empty()) {
        constexpr std::size_t kMaxBody = 256;
        text += ": " + response.body.substr(0, kMaxBody);
    }
    return text;
}

} // namespace

const char* to_string(AttemptStatus status) {
    switch (status) {
        case AttemptStatus::Success: return "success";
        case AttemptStatus::Retryable: return "retryable";
        case AttemptStatus::ChecksumRejected: return "checksum-rejected";
        case AttemptStatus::HardFailure: return "hard-failure";
    }
    return "unknown";
}

const char* to_string(RetryState state) {
    switch (state) {
        case RetryState::Succeeded: return "succeeded";
        case RetryState::Exhausted: return "exhausted";
        case RetryState::Rejected: return "rejected";
    }
    return "unknown";
}

AttemptResult classify_response(const Result<TransportResponse>& response) {
    if (response.is_error()) {
        return AttemptResult::retryable(response.error());
    }

    const auto& reply = response.value();
    if (is_success_status(reply.status_code)) {
        return AttemptResult::success(reply.status_code);
    }
    if (mentions_checksum(reply.body)) {
        return AttemptResult::checksum_rejected(describe_status(reply), reply.status_code);
    }
    if (is_retryable_status(reply.status_code)) {
        return AttemptResult::retryable(describe_status(reply), reply.status_code);
    }
    return AttemptResult::hard_failure(describe_status(reply), reply.status_code);
}

RetryingTransport::RetryingTransport(RetryPolicy policy)
    : policy_(std::move(policy)) {
    if (policy_.max_retries < 1) {
        policy_.max_retries = 1;
    }
}

std::chrono::duration<double> RetryingTransport::backoff_for(int attempt) const {
    double factor = 1.0;
    for (int i = 0; i < attempt; ++i) {
        factor *= 2.0;
    }
    return policy_.backoff_base * factor;
}

void RetryingTransport::sleep(std::chrono::duration<double> delay) const {
    if (policy_.sleeper) {
        policy_.sleeper(delay);
        return;
    }
    std::this_thread::sleep_for(delay);
}

RetryResult RetryingTransport::attempt(const std::string& label, const Operation& op, ProgressTracker* progress) const {
    AttemptContext context;
    RetryResult result;

    for (int n = 0; n < policy_.max_retries; ++n) {
        context.attempt = n;
        if (n > 0 && progress) {
            progress->reset();
        }

        AttemptResult outcome = op(context);
        result.attempts = n + 1;
        result.last_status = outcome.status_code;
        result.last_error = outcome.error;

        if (outcome.status == AttemptStatus::Success) {
            result.state = RetryState::Succeeded;
            return result;
        }

        if (outcome.status == AttemptStatus::HardFailure) {
            spdlog::error("{}: attempt {}/{} rejected: {}", label, n + 1, policy_.max_retries, outcome.error);
            result.state = RetryState::Rejected;
            return result;
        }

        spdlog::warn("{}: attempt {}/{} failed ({}): {}",
                     label, n + 1, policy_.max_retries, to_string(outcome.status), outcome.error);

        if (outcome.status == AttemptStatus::ChecksumRejected && !context.checksum_deploy_fallback) {
            spdlog::warn("{}: checksum rejected, switching to X-Checksum-Deploy for remaining attempts", label);
            context.checksum_deploy_fallback = true;
        }

        if (n + 1 < policy_.max_retries) {
            const auto delay = backoff_for(n);
            spdlog::info("{}: waiting {:.1f}s before retry", label, delay.count());
            sleep(delay);
        }
    }

    spdlog::error("{}: giving up after {} attempts", label, result.attempts);
    result.state = RetryState::Exhausted;
    return result;
}

} // namespace chunkflow::transfer
