/**
 * @file transfer_state_machine.cpp
 * @brief Implementation of the download state machine
 */

#include "kcenon/xdcc_client/session/transfer_state_machine.h"
#include "kcenon/xdcc_client/core/logging.h"

namespace kcenon::xdcc_client {

auto transfer_state_machine::on_request_sent() -> bool {
    if (state_.phase != transfer_phase::connecting) {
        return false;
    }
    move_to(transfer_phase::awaiting_response);
    return true;
}

auto transfer_state_machine::on_message(const status_message& message) -> bool {
    if (is_terminal()) {
        XC_LOG_DEBUG(log_category::state,
            std::string("Ignoring ") + to_string(kind_of(message)) +
            " message after terminal phase " + to_string(state_.phase));
        return false;
    }
    return std::visit([this](const auto& m) { return handle(m); }, message);
}

auto transfer_state_machine::on_timeout() -> bool {
    if (is_terminal()) {
        return false;
    }
    move_to(transfer_phase::timed_out);
    return true;
}

auto transfer_state_machine::on_connection_closed() -> bool {
    if (is_terminal()) {
        return false;
    }
    if (state_.last_percent > 0) {
        move_to(transfer_phase::completed_ambiguous);
        return true;
    }
    return fail(failure_cause::closed_without_progress,
                "Server closed the connection without any progress");
}

auto transfer_state_machine::on_transport_error(const error& err) -> bool {
    if (is_terminal()) {
        return false;
    }
    return fail(failure_cause::transport_error, err.message);
}

auto transfer_state_machine::on_cancelled() -> bool {
    if (is_terminal()) {
        return false;
    }
    return fail(failure_cause::cancelled, "Operation cancelled");
}

void transfer_state_machine::on_transition(transition_callback callback) {
    transition_callback_ = std::move(callback);
}

auto transfer_state_machine::handle(const accepted_message& message) -> bool {
    if (state_.phase != transfer_phase::awaiting_response) {
        XC_LOG_DEBUG(log_category::state,
            std::string("Ignoring accepted message in phase ") + to_string(state_.phase));
        return false;
    }
    state_.accepted = message;
    move_to(transfer_phase::in_progress);
    return true;
}

auto transfer_state_machine::handle(const progress_message& message) -> bool {
    if (state_.phase != transfer_phase::awaiting_response &&
        state_.phase != transfer_phase::in_progress) {
        XC_LOG_DEBUG(log_category::state,
            std::string("Ignoring progress message in phase ") + to_string(state_.phase));
        return false;
    }

    // Percent is advisory; a lower value than before is recorded as is.
    state_.last_percent = message.percent;
    state_.last_progress = message;
    move_to(transfer_phase::in_progress);
    return true;
}

auto transfer_state_machine::handle(const success_message& message) -> bool {
    if (state_.phase != transfer_phase::awaiting_response &&
        state_.phase != transfer_phase::in_progress) {
        XC_LOG_DEBUG(log_category::state,
            std::string("Ignoring success message in phase ") + to_string(state_.phase));
        return false;
    }
    state_.success = message;
    move_to(transfer_phase::completed_success);
    return true;
}

auto transfer_state_machine::handle(const failure_message& message) -> bool {
    return fail(failure_cause::server_error, message.reason);
}

auto transfer_state_machine::handle(const unrecognized_message& message) -> bool {
    std::string status = unknown_text;
    auto it = message.raw_fields.find("status");
    if (it != message.raw_fields.end() && it->is_string()) {
        status = it->get<std::string>();
    }
    XC_LOG_DEBUG(log_category::state, "Ignoring message with status '" + status + "'");
    return false;
}

auto transfer_state_machine::fail(failure_cause cause, std::string reason) -> bool {
    state_.cause = cause;
    state_.failure_reason = std::move(reason);
    move_to(transfer_phase::completed_failure);
    return true;
}

void transfer_state_machine::move_to(transfer_phase next) {
    auto previous = state_.phase;
    state_.phase = next;
    if (previous == next) {
        return;
    }

    XC_LOG_DEBUG(log_category::state,
        std::string("Transfer phase changed: ") + to_string(previous) + " -> " +
        to_string(next));

    if (transition_callback_) {
        transition_callback_(previous, next);
    }
}

auto to_exit_code(const transfer_state& state, const completion_policy& policy) -> int {
    switch (state.phase) {
        case transfer_phase::completed_success:
            return exit_code_success;
        case transfer_phase::completed_ambiguous:
            return policy.evaluate(state.last_percent) == ambiguous_verdict::likely_complete
                       ? exit_code_success
                       : exit_code_failure;
        default:
            return exit_code_failure;
    }
}

}  // namespace kcenon::xdcc_client
