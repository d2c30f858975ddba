/**
 * @file session_config.cpp
 * @brief Session configuration validation and builder
 */

#include "kcenon/xdcc_client/session/session_config.h"

namespace kcenon::xdcc_client {

namespace {

auto invalid(std::string message) -> result<void> {
    return unexpected{error{error_code::invalid_configuration, std::move(message)}};
}

}  // namespace

auto validate(const session_config& config) -> result<void> {
    if (config.server.host.empty()) {
        return invalid("Server host must not be empty");
    }
    if (config.server.port == 0) {
        return invalid("Server port must not be zero");
    }
    if (config.bot_name.empty()) {
        return invalid("Bot name is required");
    }
    if (config.pack_number.empty()) {
        return invalid("Pack number is required");
    }
    if (config.read_timeout.count() <= 0) {
        return invalid("Read timeout must be positive");
    }
    if (config.connect_timeout.count() <= 0) {
        return invalid("Connect timeout must be positive");
    }
    if (config.poll_interval.count() <= 0) {
        return invalid("Poll interval must be positive");
    }
    if (config.receive_chunk_size == 0) {
        return invalid("Receive chunk size must be positive");
    }
    if (config.policy.likely_complete_above < 0 || config.policy.likely_complete_above > 100) {
        return invalid("Completion threshold must be between 0 and 100");
    }
    if (config.decoder.max_frame_size == 0) {
        return invalid("Maximum frame size must be positive");
    }
    return {};
}

auto session_config_builder::with_server(endpoint server) -> session_config_builder& {
    config_.server = std::move(server);
    return *this;
}

auto session_config_builder::with_bot_name(std::string bot_name) -> session_config_builder& {
    config_.bot_name = std::move(bot_name);
    return *this;
}

auto session_config_builder::with_pack_number(std::string pack_number)
    -> session_config_builder& {
    config_.pack_number = std::move(pack_number);
    return *this;
}

auto session_config_builder::with_send_progress(bool enable) -> session_config_builder& {
    config_.send_progress = enable;
    return *this;
}

auto session_config_builder::with_read_timeout(std::chrono::milliseconds timeout)
    -> session_config_builder& {
    config_.read_timeout = timeout;
    return *this;
}

auto session_config_builder::with_connect_timeout(std::chrono::milliseconds timeout)
    -> session_config_builder& {
    config_.connect_timeout = timeout;
    return *this;
}

auto session_config_builder::with_poll_interval(std::chrono::milliseconds interval)
    -> session_config_builder& {
    config_.poll_interval = interval;
    return *this;
}

auto session_config_builder::with_receive_chunk_size(std::size_t size)
    -> session_config_builder& {
    config_.receive_chunk_size = size;
    return *this;
}

auto session_config_builder::with_completion_threshold(int likely_complete_above)
    -> session_config_builder& {
    config_.policy.likely_complete_above = likely_complete_above;
    return *this;
}

auto session_config_builder::with_max_frame_size(std::size_t size) -> session_config_builder& {
    config_.decoder.max_frame_size = size;
    return *this;
}

auto session_config_builder::build() const -> result<session_config> {
    auto check = validate(config_);
    if (!check) {
        return unexpected{check.error()};
    }
    return config_;
}

}  // namespace kcenon::xdcc_client
