/**
 * @file session_controller.cpp
 * @brief Download session controller implementation
 */

#include "kcenon/xdcc_client/session/session_controller.h"

#include <kcenon/xdcc_client/core/frame_decoder.h>
#include <kcenon/xdcc_client/core/logging.h>
#include <kcenon/xdcc_client/protocol/message_classifier.h>
#include <kcenon/xdcc_client/transport/tcp_transport.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <utility>
#include <vector>

namespace kcenon::xdcc_client {

auto describe_outcome(const transfer_state& state, const completion_policy& policy)
    -> std::string {
    const auto percent = std::to_string(state.last_percent);

    switch (state.phase) {
        case transfer_phase::completed_success: {
            if (!state.success) {
                return "Download completed successfully";
            }
            return "Download completed successfully: " + state.success->filename + " (" +
                   std::to_string(state.success->size_bytes) + " bytes) saved to " +
                   state.success->saved_path;
        }
        case transfer_phase::completed_failure:
            switch (state.cause) {
                case failure_cause::server_error:
                    return "Download failed: " + state.failure_reason;
                case failure_cause::transport_error:
                    return "Connection error: " + state.failure_reason;
                case failure_cause::closed_without_progress:
                    return "Server closed connection without any progress updates";
                case failure_cause::cancelled:
                    return "Operation cancelled by user at " + percent + "%";
                default:
                    return "Download failed";
            }
        case transfer_phase::completed_ambiguous:
            if (policy.evaluate(state.last_percent) == ambiguous_verdict::likely_complete) {
                return "Server closed connection at " + percent +
                       "%, download likely completed successfully";
            }
            return "Server closed connection at " + percent +
                   "%, download may still be in progress on the server";
        case transfer_phase::timed_out:
            if (state.last_percent > 0) {
                return "Timeout waiting for server response after reaching " + percent +
                       "%, download may be continuing on the server";
            }
            return "Timeout waiting for server response";
        default:
            return std::string("Session not finished (") + to_string(state.phase) + ")";
    }
}

struct session_controller::impl {
    session_config config;
    std::unique_ptr<transport_interface> transport;

    transfer_state_machine machine;
    frame_decoder decoder;
    progress_estimator estimator;

    std::atomic<bool> cancelled{false};
    bool started = false;

    // Guards machine state read by state() from other threads
    mutable std::mutex state_mutex;
    std::vector<std::pair<transfer_phase, transfer_phase>> pending_transitions;

    // Callbacks
    std::function<void(const accepted_message&)> accepted_callback;
    std::function<void(const progress_update&)> progress_callback;
    std::function<void(transfer_phase, transfer_phase)> state_callback;

    impl(session_config cfg, std::unique_ptr<transport_interface> t)
        : config(std::move(cfg)), transport(std::move(t)), decoder(config.decoder) {
        machine.on_transition([this](transfer_phase from, transfer_phase to) {
            pending_transitions.emplace_back(from, to);
        });
    }

    auto log_context() const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.bot_name = config.bot_name;
        ctx.pack_number = config.pack_number;
        ctx.server_address = config.server.to_string();
        return ctx;
    }

    /**
     * @brief Apply an event to the state machine and report transitions
     *
     * Callbacks run after the state lock is released so they may call back
     * into the controller.
     */
    template <typename Event>
    auto apply(Event&& event) -> bool {
        bool changed = false;
        std::vector<std::pair<transfer_phase, transfer_phase>> transitions;
        {
            std::lock_guard lock(state_mutex);
            changed = std::forward<Event>(event)(machine);
            transitions.swap(pending_transitions);
        }
        if (state_callback) {
            for (const auto& [from, to] : transitions) {
                state_callback(from, to);
            }
        }
        return changed;
    }

    auto is_terminal() const -> bool {
        std::lock_guard lock(state_mutex);
        return machine.is_terminal();
    }

    void fail_transport(const error& err) {
        auto ctx = log_context();
        ctx.error_message = err.message;
        XC_LOG_ERROR_CTX(log_category::session, "Transport failure", ctx);
        apply([&err](transfer_state_machine& m) { return m.on_transport_error(err); });
    }

    void handle_frame(const frame& f) {
        auto classified = classify(f);
        if (!classified) {
            XC_LOG_WARN(log_category::protocol,
                "Skipping frame at offset " + std::to_string(f.stream_offset) + ": " +
                classified.error().message);
            return;
        }

        const auto& message = classified.value();
        bool changed = apply([&message](transfer_state_machine& m) {
            return m.on_message(message);
        });
        if (!changed) {
            return;
        }

        if (const auto* accepted = std::get_if<accepted_message>(&message)) {
            XC_LOG_INFO(log_category::session, "Server accepted request: " + accepted->info);
            if (accepted_callback) {
                accepted_callback(*accepted);
            }
        } else if (const auto* progress = std::get_if<progress_message>(&message)) {
            progress_update update;
            update.message = *progress;
            update.throughput = estimator.sample(progress->bytes_received);
            update.remaining =
                progress_estimator::estimate_remaining(update.throughput, progress->bytes_total);

            auto ctx = log_context();
            ctx.filename = progress->filename;
            ctx.progress_percent = progress->percent;
            ctx.bytes_received = progress->bytes_received;
            ctx.bytes_total = progress->bytes_total;
            ctx.rate_bps = update.throughput.rate;
            XC_LOG_DEBUG_CTX(log_category::session, "Download progress", ctx);

            if (progress_callback) {
                progress_callback(update);
            }
        } else if (const auto* success = std::get_if<success_message>(&message)) {
            auto ctx = log_context();
            ctx.filename = success->filename;
            ctx.bytes_total = success->size_bytes;
            ctx.saved_path = success->saved_path;
            ctx.duration_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - estimator.start_time())
                    .count());
            XC_LOG_INFO_CTX(log_category::session, "Download completed", ctx);
        } else if (const auto* failure = std::get_if<failure_message>(&message)) {
            auto ctx = log_context();
            ctx.error_message = failure->reason;
            XC_LOG_ERROR_CTX(log_category::session, "Server reported failure", ctx);
        }
    }

    auto send_request() -> result<void> {
        download_request request{config.bot_name, config.pack_number, config.send_progress};
        auto payload = request.to_json();
        XC_LOG_DEBUG(log_category::session, "Sending request: " + payload);

        auto bytes = std::as_bytes(std::span(payload.data(), payload.size()));
        auto sent = transport->send(bytes);
        if (!sent) {
            return unexpected{sent.error()};
        }
        return {};
    }

    void read_loop() {
        std::chrono::milliseconds idle{0};

        while (!is_terminal()) {
            if (cancelled.load()) {
                apply([](transfer_state_machine& m) { return m.on_cancelled(); });
                return;
            }

            auto slice = std::min(config.poll_interval, config.read_timeout - idle);
            auto received = transport->receive(
                receive_options{config.receive_chunk_size, slice});

            if (received) {
                idle = std::chrono::milliseconds{0};
                for (const auto& f : decoder.feed(received.value())) {
                    handle_frame(f);
                    if (is_terminal()) {
                        break;
                    }
                }
                continue;
            }

            switch (received.error().code) {
                case error_code::connection_timeout:
                    idle += slice;
                    if (idle >= config.read_timeout) {
                        XC_LOG_WARN(log_category::session, "Timeout waiting for server response");
                        apply([](transfer_state_machine& m) { return m.on_timeout(); });
                    }
                    break;
                case error_code::connection_closed:
                    XC_LOG_INFO(log_category::session, "Server closed connection");
                    for (const auto& f : decoder.finish()) {
                        handle_frame(f);
                        if (is_terminal()) {
                            break;
                        }
                    }
                    apply([](transfer_state_machine& m) { return m.on_connection_closed(); });
                    break;
                default:
                    fail_transport(received.error());
                    break;
            }
        }
    }

    void execute() {
        estimator.restart();

        if (cancelled.load()) {
            apply([](transfer_state_machine& m) { return m.on_cancelled(); });
            return;
        }

        XC_LOG_INFO(log_category::session, "Connecting to " + config.server.to_string());
        auto connected = transport->connect(
            config.server, connect_options{config.connect_timeout, &cancelled});
        if (!connected) {
            if (cancelled.load()) {
                apply([](transfer_state_machine& m) { return m.on_cancelled(); });
            } else {
                fail_transport(connected.error());
            }
            return;
        }

        auto sent = send_request();
        if (!sent) {
            fail_transport(sent.error());
            return;
        }
        apply([](transfer_state_machine& m) { return m.on_request_sent(); });

        read_loop();
    }

    void release_transport() {
        auto result = transport->disconnect();
        if (!result) {
            XC_LOG_WARN(log_category::session,
                "Failed to close connection: " + result.error().message);
        }
    }
};

session_controller::session_controller(session_config config,
                                       std::unique_ptr<transport_interface> transport)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport))) {
    get_logger().initialize();
}

session_controller::~session_controller() = default;

session_controller::session_controller(session_controller&&) noexcept = default;
auto session_controller::operator=(session_controller&&) noexcept
    -> session_controller& = default;

auto session_controller::run() -> result<session_outcome> {
    if (impl_->started) {
        return unexpected{error{error_code::already_initialized,
            "Session has already been run"}};
    }
    impl_->started = true;

    auto valid = validate(impl_->config);
    if (!valid) {
        XC_LOG_ERROR(log_category::session, valid.error().message);
        return unexpected{valid.error()};
    }

    if (!impl_->transport) {
        impl_->transport = tcp_transport::create(
            transport_config_builder::tcp()
                .with_abort_check_interval(impl_->config.poll_interval)
                .build_tcp());
    }

    try {
        impl_->execute();
    } catch (const std::exception& e) {
        impl_->fail_transport(error{error_code::internal_error,
            std::string("Unexpected error: ") + e.what()});
    }

    try {
        impl_->release_transport();
    } catch (const std::exception& e) {
        XC_LOG_WARN(log_category::session,
            std::string("Failed to close connection: ") + e.what());
    }

    session_outcome outcome;
    outcome.state = state();
    outcome.exit_code = to_exit_code(outcome.state, impl_->config.policy);
    if (outcome.state.phase == transfer_phase::completed_ambiguous) {
        outcome.verdict = impl_->config.policy.evaluate(outcome.state.last_percent);
    }
    outcome.summary = describe_outcome(outcome.state, impl_->config.policy);

    XC_LOG_INFO(log_category::session, outcome.summary);
    return outcome;
}

void session_controller::cancel() noexcept {
    impl_->cancelled.store(true);
}

auto session_controller::is_cancelled() const noexcept -> bool {
    return impl_->cancelled.load();
}

auto session_controller::state() const -> transfer_state {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->machine.state();
}

auto session_controller::config() const -> const session_config& {
    return impl_->config;
}

void session_controller::on_accepted(std::function<void(const accepted_message&)> callback) {
    impl_->accepted_callback = std::move(callback);
}

void session_controller::on_progress(std::function<void(const progress_update&)> callback) {
    impl_->progress_callback = std::move(callback);
}

void session_controller::on_state_changed(
    std::function<void(transfer_phase from, transfer_phase to)> callback) {
    impl_->state_callback = std::move(callback);
}

}  // namespace kcenon::xdcc_client
