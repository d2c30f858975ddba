/**
 * @file transfer_state_machine.h
 * @brief Lifecycle of a single remote download
 * @version 0.1.0
 *
 * Consumes classified status messages and connection-level signals and
 * drives the session to exactly one terminal outcome.
 */

#ifndef KCENON_XDCC_CLIENT_SESSION_TRANSFER_STATE_MACHINE_H
#define KCENON_XDCC_CLIENT_SESSION_TRANSFER_STATE_MACHINE_H

#include <functional>
#include <optional>
#include <string>

#include "kcenon/xdcc_client/core/types.h"
#include "kcenon/xdcc_client/protocol/status_message.h"

namespace kcenon::xdcc_client {

/**
 * @brief Transfer phase
 *
 * The completed_* and timed_out phases are terminal.
 */
enum class transfer_phase {
    connecting,           ///< Request not sent yet
    awaiting_response,    ///< Request sent, nothing heard back
    in_progress,          ///< Server accepted or reported progress
    completed_success,    ///< Server reported success
    completed_failure,    ///< Server error, transport failure, cancel, or close without progress
    completed_ambiguous,  ///< Clean close after progress, no terminal message
    timed_out             ///< No data within the read timeout
};

[[nodiscard]] constexpr auto to_string(transfer_phase phase) -> const char* {
    switch (phase) {
        case transfer_phase::connecting: return "connecting";
        case transfer_phase::awaiting_response: return "awaiting_response";
        case transfer_phase::in_progress: return "in_progress";
        case transfer_phase::completed_success: return "completed_success";
        case transfer_phase::completed_failure: return "completed_failure";
        case transfer_phase::completed_ambiguous: return "completed_ambiguous";
        case transfer_phase::timed_out: return "timed_out";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(transfer_phase phase) -> bool {
    return phase == transfer_phase::completed_success ||
           phase == transfer_phase::completed_failure ||
           phase == transfer_phase::completed_ambiguous ||
           phase == transfer_phase::timed_out;
}

/**
 * @brief Why a session ended in completed_failure
 */
enum class failure_cause {
    none,
    server_error,             ///< Server sent an "error" message
    transport_error,          ///< Connect, send or read failed, or abrupt close
    closed_without_progress,  ///< Clean close before any progress
    cancelled                 ///< Interrupted locally
};

[[nodiscard]] constexpr auto to_string(failure_cause cause) -> const char* {
    switch (cause) {
        case failure_cause::none: return "none";
        case failure_cause::server_error: return "server_error";
        case failure_cause::transport_error: return "transport_error";
        case failure_cause::closed_without_progress: return "closed_without_progress";
        case failure_cause::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Reading of an ambiguous outcome
 */
enum class ambiguous_verdict {
    likely_complete,
    uncertain
};

[[nodiscard]] constexpr auto to_string(ambiguous_verdict verdict) -> const char* {
    switch (verdict) {
        case ambiguous_verdict::likely_complete: return "likely_complete";
        case ambiguous_verdict::uncertain: return "uncertain";
        default: return "unknown";
    }
}

/**
 * @brief Policy for reading a clean close after partial progress
 *
 * The protocol does not define what a mid-transfer close means. The default
 * threshold treats anything past 90% as a finished download.
 */
struct completion_policy {
    /// Last percent strictly above this value reads as likely complete
    int likely_complete_above = 90;

    [[nodiscard]] auto evaluate(int last_percent) const -> ambiguous_verdict {
        return last_percent > likely_complete_above ? ambiguous_verdict::likely_complete
                                                    : ambiguous_verdict::uncertain;
    }
};

/**
 * @brief Snapshot of the transfer as seen by the client
 */
struct transfer_state {
    transfer_phase phase = transfer_phase::connecting;
    int last_percent = 0;  ///< Latest reported percent, 0 if none

    std::optional<accepted_message> accepted;
    std::optional<progress_message> last_progress;
    std::optional<success_message> success;

    failure_cause cause = failure_cause::none;
    std::string failure_reason;

    [[nodiscard]] auto is_terminal() const -> bool {
        return xdcc_client::is_terminal(phase);
    }
};

/**
 * @brief Explicit state machine for one download session
 *
 * Every event handler returns true when it changed the state. Once a terminal
 * phase is reached every later event is ignored.
 *
 * @code
 * transfer_state_machine machine;
 * machine.on_request_sent();
 * machine.on_message(classify(frame).value());
 * if (machine.is_terminal()) {
 *     return to_exit_code(machine.state(), completion_policy{});
 * }
 * @endcode
 */
class transfer_state_machine {
public:
    using transition_callback = std::function<void(transfer_phase from, transfer_phase to)>;

    transfer_state_machine() = default;

    [[nodiscard]] auto state() const -> const transfer_state& { return state_; }
    [[nodiscard]] auto phase() const -> transfer_phase { return state_.phase; }
    [[nodiscard]] auto is_terminal() const -> bool { return state_.is_terminal(); }

    /**
     * @brief The request was written to the transport
     */
    auto on_request_sent() -> bool;

    /**
     * @brief A classified status message arrived
     */
    auto on_message(const status_message& message) -> bool;

    /**
     * @brief No data arrived within the read timeout
     */
    auto on_timeout() -> bool;

    /**
     * @brief The server closed the connection cleanly
     */
    auto on_connection_closed() -> bool;

    /**
     * @brief Connect, send or read failed, or the connection dropped
     */
    auto on_transport_error(const error& err) -> bool;

    /**
     * @brief The session was interrupted locally
     */
    auto on_cancelled() -> bool;

    /**
     * @brief Observe phase changes
     */
    void on_transition(transition_callback callback);

private:
    auto handle(const accepted_message& message) -> bool;
    auto handle(const progress_message& message) -> bool;
    auto handle(const success_message& message) -> bool;
    auto handle(const failure_message& message) -> bool;
    auto handle(const unrecognized_message& message) -> bool;

    auto fail(failure_cause cause, std::string reason) -> bool;
    void move_to(transfer_phase next);

    transfer_state state_;
    transition_callback transition_callback_;
};

inline constexpr int exit_code_success = 0;
inline constexpr int exit_code_failure = 1;

/**
 * @brief Map a terminal state to a process exit code
 *
 * 0 for success or an ambiguous close the policy reads as likely complete,
 * 1 for everything else (including non-terminal states).
 */
[[nodiscard]] auto to_exit_code(const transfer_state& state,
                                const completion_policy& policy = {}) -> int;

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_SESSION_TRANSFER_STATE_MACHINE_H
