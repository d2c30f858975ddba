/**
 * @file types.h
 * @brief Core type definitions for xdcc_client
 */

#ifndef KCENON_XDCC_CLIENT_CORE_TYPES_H
#define KCENON_XDCC_CLIENT_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace kcenon::xdcc_client {

/**
 * @brief Error codes for download session operations
 */
enum class error_code {
    success = 0,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    connection_refused = -162,
    connection_lost = -163,
    connection_closed = -164,
    send_failed = -165,

    // Protocol errors (-180 to -199)
    malformed_frame = -180,

    // Configuration errors (-140 to -159)
    invalid_configuration = -141,

    // Session errors (-220 to -239)
    transfer_cancelled = -221,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    already_initialized = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::connection_closed:
            return "connection closed";
        case error_code::send_failed:
            return "send failed";
        case error_code::malformed_frame:
            return "malformed frame";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Tag carrying the error side of a result
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Either a value of type T or an error
 *
 * Mirrors the subset of std::expected used by the client. Calling value() on
 * an error result is undefined; check has_value() first.
 */
template <typename T>
class result {
public:
    result() : storage_(std::in_place_index<1>) {}
    result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    result(unexpected u) : storage_(std::in_place_index<1>, std::move(u.err)) {}

    [[nodiscard]] auto has_value() const noexcept -> bool { return storage_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] auto value() & -> T& { return *std::get_if<0>(&storage_); }
    [[nodiscard]] auto value() const& -> const T& { return *std::get_if<0>(&storage_); }
    [[nodiscard]] auto value() && -> T&& { return std::move(*std::get_if<0>(&storage_)); }

    [[nodiscard]] auto error() const -> const struct error& {
        static const struct error none{};
        const auto* err = std::get_if<1>(&storage_);
        return err ? *err : none;
    }

private:
    std::variant<T, struct error> storage_;
};

/**
 * @brief Result of an operation that only reports success or failure
 */
template <>
class result<void> {
public:
    result() = default;
    result(unexpected u) : error_(std::move(u.err)) {}

    [[nodiscard]] auto has_value() const noexcept -> bool { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] auto error() const -> const struct error& {
        static const struct error none{};
        return error_ ? *error_ : none;
    }

private:
    std::optional<struct error> error_;
};

/**
 * @brief Network endpoint
 */
struct endpoint {
    std::string host;
    uint16_t port;

    endpoint() : port(0) {}
    endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

    [[nodiscard]] auto to_string() const -> std::string {
        return host + ":" + std::to_string(port);
    }
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_CORE_TYPES_H
