/**
 * @file status_message.h
 * @brief Status messages sent by the download server
 */

#ifndef KCENON_XDCC_CLIENT_PROTOCOL_STATUS_MESSAGE_H
#define KCENON_XDCC_CLIENT_PROTOCOL_STATUS_MESSAGE_H

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace kcenon::xdcc_client {

/// Value used for text fields missing from the wire payload
inline constexpr const char* unknown_text = "unknown";

/**
 * @brief Server accepted the request ("downloading")
 */
struct accepted_message {
    std::string info = unknown_text;
    std::string pack_number = unknown_text;
};

/**
 * @brief Periodic transfer progress ("progress")
 */
struct progress_message {
    int percent = 0;  ///< 0..100, not guaranteed to be monotonic
    std::string filename = unknown_text;
    uint64_t bytes_received = 0;
    uint64_t bytes_total = 0;
};

/**
 * @brief Transfer finished on the server ("success")
 */
struct success_message {
    std::string filename = unknown_text;
    uint64_t size_bytes = 0;
    std::string saved_path = unknown_text;
    std::string pack_number = unknown_text;
};

/**
 * @brief Transfer failed on the server ("error")
 */
struct failure_message {
    std::string reason = unknown_text;
    std::string pack_number = unknown_text;
};

/**
 * @brief Well-formed object with a missing or unknown status
 */
struct unrecognized_message {
    nlohmann::json raw_fields = nlohmann::json::object();
};

/**
 * @brief Tagged union of every status message
 */
using status_message = std::variant<
    accepted_message,
    progress_message,
    success_message,
    failure_message,
    unrecognized_message>;

/**
 * @brief Discriminator matching the alternatives of status_message
 */
enum class status_kind {
    accepted,
    progress,
    success,
    failure,
    unrecognized
};

[[nodiscard]] constexpr auto to_string(status_kind kind) -> const char* {
    switch (kind) {
        case status_kind::accepted: return "accepted";
        case status_kind::progress: return "progress";
        case status_kind::success: return "success";
        case status_kind::failure: return "failure";
        case status_kind::unrecognized: return "unrecognized";
        default: return "unknown";
    }
}

/**
 * @brief Get the kind of the active alternative
 */
[[nodiscard]] inline auto kind_of(const status_message& message) -> status_kind {
    return static_cast<status_kind>(message.index());
}

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_PROTOCOL_STATUS_MESSAGE_H
