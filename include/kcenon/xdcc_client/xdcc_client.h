/**
 * @file xdcc_client.h
 * @brief Main header for xdcc_client library
 * @version 0.1.0
 *
 * Include this header to access the download session and its building
 * blocks.
 *
 * @code
 * #include <kcenon/xdcc_client/xdcc_client.h>
 *
 * using namespace kcenon::xdcc_client;
 *
 * auto config = session_config_builder()
 *     .with_server(endpoint{"localhost", 8080})
 *     .with_bot_name("CR-HOLLAND|NEW")
 *     .with_pack_number("42")
 *     .build();
 *
 * session_controller session(config.value());
 * auto outcome = session.run();
 * @endcode
 */

#ifndef KCENON_XDCC_CLIENT_XDCC_CLIENT_H
#define KCENON_XDCC_CLIENT_XDCC_CLIENT_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/xdcc_client/core/types.h"
#include "kcenon/xdcc_client/core/frame_decoder.h"
#include "kcenon/xdcc_client/core/progress_estimator.h"

// Protocol
#include "kcenon/xdcc_client/protocol/status_message.h"
#include "kcenon/xdcc_client/protocol/message_classifier.h"

// Transport
#include "kcenon/xdcc_client/transport/transport_interface.h"
#include "kcenon/xdcc_client/transport/tcp_transport.h"

// Session
#include "kcenon/xdcc_client/session/transfer_state_machine.h"
#include "kcenon/xdcc_client/session/session_config.h"
#include "kcenon/xdcc_client/session/session_controller.h"

namespace kcenon::xdcc_client {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_XDCC_CLIENT_H
