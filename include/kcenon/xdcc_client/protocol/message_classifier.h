/**
 * @file message_classifier.h
 * @brief Frame classification and request serialization
 */

#ifndef KCENON_XDCC_CLIENT_PROTOCOL_MESSAGE_CLASSIFIER_H
#define KCENON_XDCC_CLIENT_PROTOCOL_MESSAGE_CLASSIFIER_H

#include <string>
#include <string_view>

#include "kcenon/xdcc_client/core/frame_decoder.h"
#include "kcenon/xdcc_client/core/types.h"
#include "status_message.h"

namespace kcenon::xdcc_client {

/**
 * @brief Wire values of the "status" field
 */
struct status_value {
    static constexpr std::string_view downloading = "downloading";
    static constexpr std::string_view progress = "progress";
    static constexpr std::string_view success = "success";
    static constexpr std::string_view error = "error";
};

/**
 * @brief Parse a frame into a typed status message
 *
 * Unknown or missing status values yield unrecognized_message carrying the
 * parsed object. Missing or mistyped fields take their defaults.
 *
 * @param payload Frame bytes
 * @return The message, or error_code::malformed_frame when the payload is not
 *         a JSON object
 */
[[nodiscard]] auto classify(std::string_view payload) -> result<status_message>;

/**
 * @brief Classify a decoded frame
 */
[[nodiscard]] auto classify(const frame& f) -> result<status_message>;

/**
 * @brief Download request sent once after connecting
 */
struct download_request {
    std::string bot_name;
    std::string pack_number;
    bool send_progress = true;

    /**
     * @brief Serialize as a compact JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string;
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_PROTOCOL_MESSAGE_CLASSIFIER_H
