/**
 * @file progress_estimator.h
 * @brief Throughput estimation for progress display
 * @version 0.1.0
 *
 * The rate is advisory only. Nothing in the transfer state machine depends
 * on it.
 */

#ifndef KCENON_XDCC_CLIENT_CORE_PROGRESS_ESTIMATOR_H
#define KCENON_XDCC_CLIENT_CORE_PROGRESS_ESTIMATOR_H

#include <chrono>
#include <cstdint>
#include <optional>

namespace kcenon::xdcc_client {

using time_point = std::chrono::steady_clock::time_point;

/**
 * @brief Throughput observed at one progress message
 */
struct throughput_sample {
    uint64_t bytes_received = 0;
    double elapsed_seconds = 0.0;
    double rate = 0.0;  ///< bytes per second
};

/**
 * @brief Derives an average transfer rate from the session start time
 *
 * @code
 * progress_estimator estimator;
 * auto sample = estimator.sample(message.bytes_received);
 * auto eta = progress_estimator::estimate_remaining(sample, message.bytes_total);
 * @endcode
 */
class progress_estimator {
public:
    /// Smallest elapsed time used as a divisor
    static constexpr double default_epsilon_seconds = 0.001;

    progress_estimator();
    explicit progress_estimator(time_point start,
                                double epsilon_seconds = default_epsilon_seconds);

    /**
     * @brief Compute the rate for the bytes received so far
     * @param bytes_received Cumulative bytes reported by the server
     * @param now Sampling time (a time before start counts as no elapsed time)
     */
    [[nodiscard]] auto sample(uint64_t bytes_received, time_point now) const
        -> throughput_sample;

    /**
     * @brief Compute the rate at the current time
     */
    [[nodiscard]] auto sample(uint64_t bytes_received) const -> throughput_sample;

    /**
     * @brief Estimate the time left to reach bytes_total at the sampled rate
     * @return Remaining time, or nullopt when the rate or total is unknown or
     *         the estimate does not fit in milliseconds
     */
    [[nodiscard]] static auto estimate_remaining(const throughput_sample& sample,
                                                 uint64_t bytes_total)
        -> std::optional<std::chrono::milliseconds>;

    /**
     * @brief Restart the clock
     */
    void restart(time_point start = std::chrono::steady_clock::now());

    [[nodiscard]] auto start_time() const noexcept -> time_point { return start_; }

private:
    time_point start_;
    double epsilon_seconds_;
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_CORE_PROGRESS_ESTIMATOR_H
