/**
 * @file tcp_transport.h
 * @brief TCP transport implementation
 * @version 0.1.0
 *
 * This file implements the transport_interface for TCP connections.
 */

#ifndef KCENON_XDCC_CLIENT_TRANSPORT_TCP_TRANSPORT_H
#define KCENON_XDCC_CLIENT_TRANSPORT_TCP_TRANSPORT_H

#include <memory>

#include "transport_interface.h"
#include "transport_config.h"

namespace kcenon::xdcc_client {

/**
 * @brief TCP transport implementation
 *
 * Provides TCP-based transport using the network_system messaging client.
 * Incoming data is queued by the network thread and handed out by receive().
 *
 * @code
 * std::atomic<bool> stop{false};
 * auto transport = tcp_transport::create(
 *     transport_config_builder::tcp()
 *         .with_abort_check_interval(std::chrono::milliseconds{100})
 *         .build_tcp());
 *
 * auto result = transport->connect(endpoint{"localhost", 8080},
 *                                  {.timeout = std::chrono::seconds{10}, .abort = &stop});
 * if (result.has_value()) {
 *     auto data = transport->receive({.max_size = 4096, .timeout = std::chrono::seconds{60}});
 * }
 * @endcode
 */
class tcp_transport : public transport_interface {
public:
    /**
     * @brief Create a TCP transport instance
     * @param config TCP configuration
     */
    [[nodiscard]] static auto create(const tcp_transport_config& config = {})
        -> std::unique_ptr<tcp_transport>;

    ~tcp_transport() override;

    // Non-copyable
    tcp_transport(const tcp_transport&) = delete;
    auto operator=(const tcp_transport&) -> tcp_transport& = delete;

    // Movable
    tcp_transport(tcp_transport&&) noexcept;
    auto operator=(tcp_transport&&) noexcept -> tcp_transport&;

    // ========================================================================
    // transport_interface implementation
    // ========================================================================

    [[nodiscard]] auto type() const -> std::string_view override;

    [[nodiscard]] auto connect(
        const endpoint& remote,
        const connect_options& options = {}) -> result<void> override;
    [[nodiscard]] auto disconnect() -> result<void> override;
    [[nodiscard]] auto is_connected() const -> bool override;
    [[nodiscard]] auto state() const -> transport_state override;

    [[nodiscard]] auto send(std::span<const std::byte> data) -> result<std::size_t> override;
    [[nodiscard]] auto receive(
        const receive_options& options = {}) -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto get_statistics() const -> transport_statistics override;

    [[nodiscard]] auto config() const -> const tcp_transport_config&;

private:
    explicit tcp_transport(tcp_transport_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_TRANSPORT_TCP_TRANSPORT_H
