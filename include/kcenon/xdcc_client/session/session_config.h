/**
 * @file session_config.h
 * @brief Download session configuration and builder
 * @version 0.1.0
 */

#ifndef KCENON_XDCC_CLIENT_SESSION_SESSION_CONFIG_H
#define KCENON_XDCC_CLIENT_SESSION_SESSION_CONFIG_H

#include <chrono>
#include <cstddef>
#include <string>

#include "kcenon/xdcc_client/core/frame_decoder.h"
#include "kcenon/xdcc_client/core/types.h"
#include "transfer_state_machine.h"

namespace kcenon::xdcc_client {

/**
 * @brief Settings for one download session
 */
struct session_config {
    endpoint server{"localhost", 8080};

    std::string bot_name;
    std::string pack_number;
    bool send_progress = true;

    /// Idle time without any received bytes before the session times out
    std::chrono::milliseconds read_timeout{60000};

    std::chrono::milliseconds connect_timeout{10000};

    /// Granularity of cancellation checks while waiting for data
    std::chrono::milliseconds poll_interval{250};

    std::size_t receive_chunk_size = 4096;

    completion_policy policy;
    frame_decoder_config decoder;
};

/**
 * @brief Check a configuration before a session is started
 * @return error_code::invalid_configuration describing the first problem found
 */
[[nodiscard]] auto validate(const session_config& config) -> result<void>;

/**
 * @brief Builder for session_config
 *
 * @code
 * auto config = session_config_builder()
 *     .with_server(endpoint{"localhost", 8080})
 *     .with_bot_name("CR-HOLLAND|NEW")
 *     .with_pack_number("42")
 *     .with_read_timeout(std::chrono::seconds{60})
 *     .build();
 * if (!config) {
 *     std::cerr << config.error().message << "\n";
 * }
 * @endcode
 */
class session_config_builder {
public:
    session_config_builder() = default;

    auto with_server(endpoint server) -> session_config_builder&;
    auto with_bot_name(std::string bot_name) -> session_config_builder&;
    auto with_pack_number(std::string pack_number) -> session_config_builder&;
    auto with_send_progress(bool enable) -> session_config_builder&;
    auto with_read_timeout(std::chrono::milliseconds timeout) -> session_config_builder&;
    auto with_connect_timeout(std::chrono::milliseconds timeout) -> session_config_builder&;
    auto with_poll_interval(std::chrono::milliseconds interval) -> session_config_builder&;
    auto with_receive_chunk_size(std::size_t size) -> session_config_builder&;

    /**
     * @brief Set how a clean close after partial progress is read
     * @param likely_complete_above Percent strictly above which the download counts as done
     */
    auto with_completion_threshold(int likely_complete_above) -> session_config_builder&;

    auto with_max_frame_size(std::size_t size) -> session_config_builder&;

    /**
     * @brief Validate and return the configuration
     */
    [[nodiscard]] auto build() const -> result<session_config>;

private:
    session_config config_;
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_SESSION_SESSION_CONFIG_H
