/**
 * @file message_classifier.cpp
 * @brief Implementation of status message classification
 */

#include "kcenon/xdcc_client/protocol/message_classifier.h"

#include <cmath>
#include <limits>

namespace kcenon::xdcc_client {

namespace {

using json = nlohmann::json;

auto text_field(const json& object, const char* key) -> std::string {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return unknown_text;
    }
    return it->get<std::string>();
}

// The server echoes the pack number from the request, which may have been
// sent as a number by other clients.
auto pack_field(const json& object) -> std::string {
    auto it = object.find("pack_number");
    if (it == object.end()) {
        return unknown_text;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_unsigned()) {
        return std::to_string(it->get<uint64_t>());
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<int64_t>());
    }
    if (it->is_number_float()) {
        return it->dump();
    }
    return unknown_text;
}

auto percent_field(const json& object, const char* key) -> int {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return 0;
    }
    double value = std::trunc(it->get<double>());
    if (value < 0.0) return 0;
    if (value > 100.0) return 100;
    return static_cast<int>(value);
}

auto count_field(const json& object, const char* key) -> uint64_t {
    auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (!(value > 0.0)) return 0;
        if (value >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
            return std::numeric_limits<uint64_t>::max();
        }
        return static_cast<uint64_t>(value);
    }
    // negative integers and non-numbers
    return 0;
}

}  // namespace

auto classify(std::string_view payload) -> result<status_message> {
    json object;
    try {
        object = json::parse(payload);
    } catch (const json::parse_error& e) {
        return unexpected{error{error_code::malformed_frame,
            std::string("Frame is not valid JSON: ") + e.what()}};
    }

    if (!object.is_object()) {
        return unexpected{error{error_code::malformed_frame,
            "Frame is not a JSON object"}};
    }

    auto status_it = object.find("status");
    if (status_it == object.end() || !status_it->is_string()) {
        return status_message{unrecognized_message{std::move(object)}};
    }

    const auto& status = status_it->get_ref<const std::string&>();

    if (status == status_value::downloading) {
        accepted_message message;
        message.info = text_field(object, "message");
        message.pack_number = pack_field(object);
        return status_message{std::move(message)};
    }

    if (status == status_value::progress) {
        progress_message message;
        message.percent = percent_field(object, "progress");
        message.filename = text_field(object, "filename");
        message.bytes_received = count_field(object, "received");
        message.bytes_total = count_field(object, "total");
        return status_message{std::move(message)};
    }

    if (status == status_value::success) {
        success_message message;
        message.filename = text_field(object, "filename");
        message.size_bytes = count_field(object, "size");
        message.saved_path = text_field(object, "path");
        message.pack_number = pack_field(object);
        return status_message{std::move(message)};
    }

    if (status == status_value::error) {
        failure_message message;
        message.reason = text_field(object, "message");
        message.pack_number = pack_field(object);
        return status_message{std::move(message)};
    }

    return status_message{unrecognized_message{std::move(object)}};
}

auto classify(const frame& f) -> result<status_message> {
    return classify(std::string_view(f.payload));
}

auto download_request::to_json() const -> std::string {
    json request = {
        {"bot_name", bot_name},
        {"pack_number", pack_number},
        {"send_progress", send_progress},
    };
    return request.dump();
}

}  // namespace kcenon::xdcc_client
