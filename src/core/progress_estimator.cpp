/**
 * @file progress_estimator.cpp
 * @brief Implementation of throughput estimation
 */

#include "kcenon/xdcc_client/core/progress_estimator.h"

#include <algorithm>
#include <cmath>

namespace kcenon::xdcc_client {

progress_estimator::progress_estimator()
    : progress_estimator(std::chrono::steady_clock::now()) {}

progress_estimator::progress_estimator(time_point start, double epsilon_seconds)
    : start_(start), epsilon_seconds_(epsilon_seconds > 0.0 ? epsilon_seconds
                                                            : default_epsilon_seconds) {}

auto progress_estimator::sample(uint64_t bytes_received, time_point now) const
    -> throughput_sample {
    throughput_sample result;
    result.bytes_received = bytes_received;

    if (now > start_) {
        result.elapsed_seconds = std::chrono::duration<double>(now - start_).count();
    }

    result.rate = static_cast<double>(bytes_received) /
                  std::max(result.elapsed_seconds, epsilon_seconds_);
    return result;
}

auto progress_estimator::sample(uint64_t bytes_received) const -> throughput_sample {
    return sample(bytes_received, std::chrono::steady_clock::now());
}

auto progress_estimator::estimate_remaining(const throughput_sample& sample,
                                            uint64_t bytes_total)
    -> std::optional<std::chrono::milliseconds> {
    if (bytes_total == 0 || sample.rate <= 0.0) {
        return std::nullopt;
    }
    if (sample.bytes_received >= bytes_total) {
        return std::chrono::milliseconds{0};
    }

    double remaining_ms =
        static_cast<double>(bytes_total - sample.bytes_received) / sample.rate * 1000.0;

    // 2^63 as a double; anything at or above it does not fit the count type
    constexpr double max_ms =
        static_cast<double>(std::chrono::milliseconds::max().count());
    if (!std::isfinite(remaining_ms) || remaining_ms >= max_ms) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{static_cast<int64_t>(remaining_ms)};
}

void progress_estimator::restart(time_point start) {
    start_ = start;
}

}  // namespace kcenon::xdcc_client
