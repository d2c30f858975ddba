/**
 * @file tcp_transport.cpp
 * @brief TCP transport implementation
 */

#include "kcenon/xdcc_client/transport/tcp_transport.h"
#include "kcenon/xdcc_client/core/logging.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include <kcenon/network/core/messaging_client.h>

// Namespace alias for network_system
namespace network = kcenon::network;

namespace kcenon::xdcc_client {

namespace {

// asio reports an orderly shutdown by the peer as misc error 2 (eof).
auto is_end_of_stream(const std::error_code& ec) -> bool {
    return ec.value() == 2 && std::string_view(ec.category().name()) == "asio.misc";
}

}  // namespace

struct tcp_transport::impl {
    tcp_transport_config config;
    std::atomic<transport_state> current_state{transport_state::disconnected};
    bool client_started = false;

    // Statistics
    mutable std::mutex stats_mutex;
    transport_statistics stats;

    // Receive side, filled by the network thread
    std::mutex receive_mutex;
    std::condition_variable receive_cv;
    std::deque<std::vector<std::byte>> receive_queue;
    bool connected_signal = false;
    bool peer_closed = false;
    std::optional<std::string> failure;

    std::shared_ptr<network::core::messaging_client> network_client;

    explicit impl(tcp_transport_config cfg) : config(std::move(cfg)) {
        network_client = std::make_shared<network::core::messaging_client>(
            "xdcc_tcp_transport");
    }

    void set_state(transport_state new_state) {
        auto old_state = current_state.exchange(new_state);
        if (old_state != new_state) {
            XC_LOG_DEBUG(log_category::transport,
                "TCP transport state changed: " +
                std::string(to_string(old_state)) + " -> " +
                std::string(to_string(new_state)));
        }
    }

    void update_send_stats(std::size_t bytes) {
        std::lock_guard lock(stats_mutex);
        stats.bytes_sent += bytes;
        stats.packets_sent++;
    }

    void update_receive_stats(std::size_t bytes) {
        std::lock_guard lock(stats_mutex);
        stats.bytes_received += bytes;
        stats.packets_received++;
    }

    void increment_errors() {
        std::lock_guard lock(stats_mutex);
        stats.errors++;
    }

    void reset_receive_side() {
        std::lock_guard lock(receive_mutex);
        receive_queue.clear();
        connected_signal = false;
        peer_closed = false;
        failure.reset();
    }

    void install_callbacks() {
        network_client->set_receive_callback(
            [this](const std::vector<std::uint8_t>& data) {
                if (data.empty()) {
                    return;
                }
                std::vector<std::byte> byte_data(data.size());
                std::transform(data.begin(), data.end(), byte_data.begin(),
                    [](std::uint8_t b) { return std::byte{b}; });

                {
                    std::lock_guard lock(receive_mutex);
                    receive_queue.push_back(std::move(byte_data));
                }
                receive_cv.notify_one();
                update_receive_stats(data.size());
            });

        network_client->set_connected_callback([this]() {
            {
                std::lock_guard lock(receive_mutex);
                connected_signal = true;
            }
            receive_cv.notify_all();
        });

        network_client->set_disconnected_callback([this]() {
            {
                std::lock_guard lock(receive_mutex);
                peer_closed = true;
            }
            receive_cv.notify_all();
        });

        network_client->set_error_callback([this](std::error_code ec) {
            {
                std::lock_guard lock(receive_mutex);
                if (is_end_of_stream(ec)) {
                    peer_closed = true;
                } else if (!failure) {
                    failure = ec.message();
                }
            }
            if (!is_end_of_stream(ec)) {
                increment_errors();
                XC_LOG_ERROR(log_category::transport,
                    "TCP transport error: " + ec.message());
            }
            receive_cv.notify_all();
        });
    }
};

tcp_transport::tcp_transport(tcp_transport_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();
    impl_->install_callbacks();
    XC_LOG_DEBUG(log_category::transport, "TCP transport created");
}

tcp_transport::~tcp_transport() {
    if (impl_ && impl_->client_started) {
        (void)disconnect();
    }
}

tcp_transport::tcp_transport(tcp_transport&&) noexcept = default;
auto tcp_transport::operator=(tcp_transport&&) noexcept -> tcp_transport& = default;

auto tcp_transport::create(const tcp_transport_config& config)
    -> std::unique_ptr<tcp_transport> {
    return std::unique_ptr<tcp_transport>(new tcp_transport(config));
}

auto tcp_transport::type() const -> std::string_view {
    return "tcp";
}

auto tcp_transport::connect(
    const endpoint& remote,
    const connect_options& options) -> result<void> {

    if (impl_->current_state == transport_state::connected ||
        impl_->current_state == transport_state::connecting) {
        return unexpected{error{error_code::already_initialized,
            "Transport is already connected or connecting"}};
    }

    auto aborted = [&options] { return options.abort && options.abort->load(); };
    if (aborted()) {
        return unexpected{error{error_code::transfer_cancelled,
            "Connection to " + remote.to_string() + " cancelled"}};
    }

    XC_LOG_INFO(log_category::transport, "TCP transport connecting to " + remote.to_string());

    impl_->reset_receive_side();
    impl_->set_state(transport_state::connecting);

    auto result = impl_->network_client->start_client(remote.host, remote.port);
    if (result.is_err()) {
        impl_->set_state(transport_state::error);
        impl_->increment_errors();
        XC_LOG_ERROR(log_category::transport,
            "TCP transport connection failed: " + result.error().message);
        return unexpected{error{error_code::connection_failed,
            "Connection failed: " + result.error().message}};
    }
    impl_->client_started = true;

    std::optional<std::string> failure;
    bool established = false;
    bool cancelled = false;
    {
        auto settled = [this] {
            return impl_->connected_signal || impl_->network_client->is_connected() ||
                   impl_->failure.has_value() || impl_->peer_closed;
        };
        auto deadline = std::chrono::steady_clock::now() + options.timeout;
        auto slice = std::max(impl_->config.abort_check_interval, std::chrono::milliseconds{1});

        std::unique_lock lock(impl_->receive_mutex);
        for (;;) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                established = settled();
                break;
            }
            auto wait = std::min<std::chrono::steady_clock::duration>(slice, deadline - now);
            if (impl_->receive_cv.wait_for(lock, wait, settled)) {
                established = true;
                break;
            }
            if (aborted()) {
                cancelled = true;
                break;
            }
        }
        failure = impl_->failure;
        if (established && !failure && impl_->peer_closed && !impl_->connected_signal &&
            !impl_->network_client->is_connected()) {
            failure = "connection closed during handshake";
        }
    }

    if (cancelled) {
        (void)impl_->network_client->stop_client();
        impl_->client_started = false;
        impl_->set_state(transport_state::disconnected);
        XC_LOG_INFO(log_category::transport,
            "TCP transport connection to " + remote.to_string() + " cancelled");
        return unexpected{error{error_code::transfer_cancelled,
            "Connection to " + remote.to_string() + " cancelled"}};
    }

    if (!established || failure) {
        (void)impl_->network_client->stop_client();
        impl_->client_started = false;
        impl_->set_state(transport_state::error);
        impl_->increment_errors();

        if (!established) {
            XC_LOG_ERROR(log_category::transport,
                "TCP transport connection to " + remote.to_string() + " timed out");
            return unexpected{error{error_code::connection_timeout,
                "Connection to " + remote.to_string() + " timed out"}};
        }
        XC_LOG_ERROR(log_category::transport, "TCP transport connection failed: " + *failure);
        return unexpected{error{error_code::connection_refused,
            "Connection failed: " + *failure}};
    }

    impl_->set_state(transport_state::connected);
    {
        std::lock_guard lock(impl_->stats_mutex);
        impl_->stats.connected_at = std::chrono::steady_clock::now();
    }

    XC_LOG_INFO(log_category::transport, "TCP transport connected to " + remote.to_string());
    return {};
}

auto tcp_transport::disconnect() -> result<void> {
    if (!impl_->client_started) {
        impl_->set_state(transport_state::disconnected);
        return {};
    }

    XC_LOG_DEBUG(log_category::transport, "TCP transport disconnecting");
    impl_->set_state(transport_state::disconnecting);

    auto result = impl_->network_client->stop_client();
    impl_->client_started = false;
    if (result.is_err()) {
        impl_->increment_errors();
        impl_->set_state(transport_state::error);
        XC_LOG_ERROR(log_category::transport,
            "TCP transport disconnect failed: " + result.error().message);
        return unexpected{error{error_code::internal_error,
            "Disconnect failed: " + result.error().message}};
    }

    impl_->set_state(transport_state::disconnected);
    XC_LOG_DEBUG(log_category::transport, "TCP transport disconnected");
    return {};
}

auto tcp_transport::is_connected() const -> bool {
    return impl_->current_state == transport_state::connected;
}

auto tcp_transport::state() const -> transport_state {
    return impl_->current_state;
}

auto tcp_transport::send(std::span<const std::byte> data) -> result<std::size_t> {
    if (!is_connected()) {
        return unexpected{error{error_code::not_initialized,
            "Transport is not connected"}};
    }

    if (data.empty()) {
        return std::size_t{0};
    }

    std::vector<std::uint8_t> send_data(data.size());
    std::transform(data.begin(), data.end(), send_data.begin(),
        [](std::byte b) { return static_cast<std::uint8_t>(b); });

    auto result = impl_->network_client->send_packet(std::move(send_data));
    if (result.is_err()) {
        impl_->increment_errors();
        return unexpected{error{error_code::send_failed,
            "Send failed: " + result.error().message}};
    }

    impl_->update_send_stats(data.size());
    return data.size();
}

auto tcp_transport::receive(const receive_options& options)
    -> result<std::vector<std::byte>> {

    if (!impl_->client_started) {
        return unexpected{error{error_code::not_initialized,
            "Transport is not connected"}};
    }

    std::unique_lock lock(impl_->receive_mutex);
    impl_->receive_cv.wait_for(lock, options.timeout, [this] {
        return !impl_->receive_queue.empty() || impl_->peer_closed ||
               impl_->failure.has_value();
    });

    // Buffered data is always handed out before the end of the stream
    if (!impl_->receive_queue.empty()) {
        auto& front = impl_->receive_queue.front();
        if (options.max_size == 0 || front.size() <= options.max_size) {
            auto data = std::move(front);
            impl_->receive_queue.pop_front();
            return data;
        }

        auto split = front.begin() + static_cast<std::ptrdiff_t>(options.max_size);
        std::vector<std::byte> data(front.begin(), split);
        front.erase(front.begin(), split);
        return data;
    }

    if (impl_->failure) {
        impl_->set_state(transport_state::error);
        return unexpected{error{error_code::connection_lost,
            "Connection lost: " + *impl_->failure}};
    }

    if (impl_->peer_closed) {
        impl_->set_state(transport_state::disconnected);
        return unexpected{error{error_code::connection_closed,
            "Connection closed by peer"}};
    }

    return unexpected{error{error_code::connection_timeout, "Receive timeout"}};
}

auto tcp_transport::get_statistics() const -> transport_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->stats;
}

auto tcp_transport::config() const -> const tcp_transport_config& {
    return impl_->config;
}

}  // namespace kcenon::xdcc_client
