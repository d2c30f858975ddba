/**
 * @file session_controller.h
 * @brief Drives one download request from connect to terminal outcome
 * @version 0.1.0
 */

#ifndef KCENON_XDCC_CLIENT_SESSION_SESSION_CONTROLLER_H
#define KCENON_XDCC_CLIENT_SESSION_SESSION_CONTROLLER_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/xdcc_client/core/progress_estimator.h"
#include "kcenon/xdcc_client/core/types.h"
#include "kcenon/xdcc_client/protocol/status_message.h"
#include "kcenon/xdcc_client/transport/transport_interface.h"
#include "session_config.h"
#include "transfer_state_machine.h"

namespace kcenon::xdcc_client {

/**
 * @brief Progress message together with its throughput sample
 */
struct progress_update {
    progress_message message;
    throughput_sample throughput;
    std::optional<std::chrono::milliseconds> remaining;
};

/**
 * @brief Final result of a session
 */
struct session_outcome {
    transfer_state state;
    int exit_code = exit_code_failure;

    /// Set only for completed_ambiguous
    std::optional<ambiguous_verdict> verdict;

    /// Human-readable status line
    std::string summary;
};

/**
 * @brief Build the status line for a terminal state
 */
[[nodiscard]] auto describe_outcome(const transfer_state& state,
                                    const completion_policy& policy = {}) -> std::string;

/**
 * @brief Download session controller
 *
 * Sends the request once, then reads until the state machine reaches a
 * terminal phase. Reads are sliced by the poll interval and the connect wait
 * checks the cancel flag, so cancel() is observed promptly. The transport is
 * disconnected on every exit path.
 *
 * @code
 * auto config = session_config_builder()
 *     .with_bot_name("CR-HOLLAND|NEW")
 *     .with_pack_number("42")
 *     .build();
 *
 * session_controller session(config.value());
 * session.on_progress([](const progress_update& update) {
 *     std::cout << update.message.percent << "%\n";
 * });
 *
 * auto outcome = session.run();
 * return outcome ? outcome.value().exit_code : 1;
 * @endcode
 */
class session_controller {
public:
    /**
     * @brief Create a session
     * @param config Session settings (validated by run())
     * @param transport Transport to use; a TCP transport is created when null
     */
    explicit session_controller(session_config config,
                                std::unique_ptr<transport_interface> transport = nullptr);

    ~session_controller();

    // Non-copyable
    session_controller(const session_controller&) = delete;
    auto operator=(const session_controller&) -> session_controller& = delete;

    // Movable
    session_controller(session_controller&&) noexcept;
    auto operator=(session_controller&&) noexcept -> session_controller&;

    /**
     * @brief Run the session to completion
     *
     * @return The outcome, or an error when the configuration is invalid or
     *         the session has already been run
     */
    [[nodiscard]] auto run() -> result<session_outcome>;

    /**
     * @brief Request cancellation
     *
     * Safe to call from another thread or a signal handler path.
     */
    void cancel() noexcept;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /**
     * @brief Current transfer state
     */
    [[nodiscard]] auto state() const -> transfer_state;

    [[nodiscard]] auto config() const -> const session_config&;

    // ========================================================================
    // Callbacks
    // ========================================================================

    /**
     * @brief Set callback for the server accepting the request
     */
    void on_accepted(std::function<void(const accepted_message&)> callback);

    /**
     * @brief Set callback for progress updates
     */
    void on_progress(std::function<void(const progress_update&)> callback);

    /**
     * @brief Set callback for phase changes
     */
    void on_state_changed(std::function<void(transfer_phase from, transfer_phase to)> callback);

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_SESSION_SESSION_CONTROLLER_H
