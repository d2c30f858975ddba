/**
 * @file transport_interface.h
 * @brief Transport abstraction layer interface
 * @version 0.1.0
 *
 * The session controller talks to the network only through this interface,
 * which lets tests drive a session from a scripted in-memory stream.
 */

#ifndef KCENON_XDCC_CLIENT_TRANSPORT_TRANSPORT_INTERFACE_H
#define KCENON_XDCC_CLIENT_TRANSPORT_TRANSPORT_INTERFACE_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "kcenon/xdcc_client/core/types.h"
#include "transport_config.h"

namespace kcenon::xdcc_client {

/**
 * @brief Transport state enumeration
 */
enum class transport_state {
    disconnected,   ///< Not connected
    connecting,     ///< Connection in progress
    connected,      ///< Connected and ready
    disconnecting,  ///< Disconnection in progress
    error           ///< Error state
};

[[nodiscard]] constexpr auto to_string(transport_state state) -> const char* {
    switch (state) {
        case transport_state::disconnected: return "disconnected";
        case transport_state::connecting: return "connecting";
        case transport_state::connected: return "connected";
        case transport_state::disconnecting: return "disconnecting";
        case transport_state::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Transport statistics
 */
struct transport_statistics {
    uint64_t bytes_sent = 0;           ///< Total bytes sent
    uint64_t bytes_received = 0;       ///< Total bytes received
    uint64_t packets_sent = 0;         ///< Total packets sent
    uint64_t packets_received = 0;     ///< Total packets received
    uint64_t errors = 0;               ///< Total errors
    std::chrono::steady_clock::time_point connected_at;  ///< Connection time
};

/**
 * @brief Connect options for transport operations
 */
struct connect_options {
    std::chrono::milliseconds timeout{10000};    ///< Connection timeout
    const std::atomic<bool>* abort = nullptr;    ///< Gives up early once set
};

/**
 * @brief Receive options for transport operations
 */
struct receive_options {
    std::size_t max_size = 4096;                 ///< Maximum bytes returned per call
    std::chrono::milliseconds timeout{30000};    ///< Receive timeout
};

/**
 * @brief Transport interface base class
 *
 * receive() reports the end of the stream through its error code:
 * - error_code::connection_timeout: nothing arrived within the timeout
 * - error_code::connection_closed: the peer closed cleanly and every
 *   buffered byte has been returned
 * - error_code::connection_lost: the connection dropped or failed
 */
class transport_interface {
public:
    virtual ~transport_interface() = default;

    // Non-copyable
    transport_interface(const transport_interface&) = delete;
    auto operator=(const transport_interface&) -> transport_interface& = delete;

    // Movable
    transport_interface(transport_interface&&) noexcept = default;
    auto operator=(transport_interface&&) noexcept -> transport_interface& = default;

    /**
     * @brief Get the transport type identifier
     */
    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    /**
     * @brief Connect to a remote endpoint
     * @param remote Remote endpoint to connect to
     * @param options Timeout and abort flag
     * @return error_code::transfer_cancelled when the abort flag was set
     *         before the connection was established
     */
    [[nodiscard]] virtual auto connect(
        const endpoint& remote,
        const connect_options& options = {}) -> result<void> = 0;

    /**
     * @brief Disconnect from the remote endpoint
     *
     * Releases the underlying connection. Safe to call in any state.
     */
    [[nodiscard]] virtual auto disconnect() -> result<void> = 0;

    [[nodiscard]] virtual auto is_connected() const -> bool = 0;

    [[nodiscard]] virtual auto state() const -> transport_state = 0;

    /**
     * @brief Send data
     * @return Bytes sent or error
     */
    [[nodiscard]] virtual auto send(std::span<const std::byte> data) -> result<std::size_t> = 0;

    /**
     * @brief Block until data arrives, the stream ends, or the timeout passes
     * @return Received bytes (never empty) or error
     */
    [[nodiscard]] virtual auto receive(
        const receive_options& options = {}) -> result<std::vector<std::byte>> = 0;

    [[nodiscard]] virtual auto get_statistics() const -> transport_statistics = 0;

protected:
    transport_interface() = default;
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_TRANSPORT_TRANSPORT_INTERFACE_H
