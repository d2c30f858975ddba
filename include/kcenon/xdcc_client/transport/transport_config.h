/**
 * @file transport_config.h
 * @brief Transport configuration types
 * @version 0.1.0
 */

#ifndef KCENON_XDCC_CLIENT_TRANSPORT_TRANSPORT_CONFIG_H
#define KCENON_XDCC_CLIENT_TRANSPORT_TRANSPORT_CONFIG_H

#include <chrono>

namespace kcenon::xdcc_client {

/**
 * @brief TCP transport configuration
 */
struct tcp_transport_config {
    /// How often a pending connect looks at its abort flag
    std::chrono::milliseconds abort_check_interval{50};
};

/**
 * @brief Transport configuration builder
 */
class transport_config_builder {
public:
    static auto tcp() -> transport_config_builder {
        return transport_config_builder{};
    }

    auto with_abort_check_interval(std::chrono::milliseconds interval)
        -> transport_config_builder& {
        config_.abort_check_interval = interval;
        return *this;
    }

    [[nodiscard]] auto build_tcp() const -> tcp_transport_config {
        return config_;
    }

private:
    tcp_transport_config config_;
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_TRANSPORT_TRANSPORT_CONFIG_H
