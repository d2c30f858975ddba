// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for the download client
 *
 * Messages go to stderr, or to logger_system when it is compiled in, so the
 * progress line on stdout stays readable. Every message can carry a
 * transfer_log_context describing the download it belongs to.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/xdcc_client/config/feature_flags.h"

namespace kcenon::xdcc_client {

/**
 * @brief Log categories for the download client
 */
struct log_category {
    static constexpr std::string_view session = "xdcc_client.session";
    static constexpr std::string_view decoder = "xdcc_client.decoder";
    static constexpr std::string_view protocol = "xdcc_client.protocol";
    static constexpr std::string_view transport = "xdcc_client.transport";
    static constexpr std::string_view state = "xdcc_client.state";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] constexpr auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Which parts of a log line are hidden
 */
struct masking_config {
    bool mask_paths = false;      ///< Directories of saved paths
    bool mask_ips = false;        ///< Dotted server addresses
    bool mask_filenames = false;  ///< File names beyond the first few characters
    char mask_char = '*';
    std::size_t visible_chars = 4;

    static auto all_masked() -> masking_config {
        return {true, true, true, '*', 4};
    }

    static auto none() -> masking_config {
        return {};
    }
};

/**
 * @brief Masks server addresses and saved paths in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask every address and path found in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string;

    /**
     * @brief Mask the directory part of a path
     *
     * The file name stays readable unless mask_filenames is set.
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string;

    /**
     * @brief Mask all but the last octet of an address
     */
    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string;

    [[nodiscard]] auto config() const -> const masking_config& { return config_; }

private:
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string;

    masking_config config_;
};

/**
 * @brief Download details attached to a log message
 */
struct transfer_log_context {
    std::string bot_name;
    std::string pack_number;
    std::string filename;
    std::optional<int> progress_percent;
    std::optional<uint64_t> bytes_received;
    std::optional<uint64_t> bytes_total;
    std::optional<double> rate_bps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> saved_path;
    std::optional<std::string> error_message;
    std::optional<std::string> server_address;

    [[nodiscard]] auto to_json() const -> std::string;

    /**
     * @brief Render the context as a JSON object
     * @param masker Applied to paths, addresses and error text when not null
     */
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

/**
 * @brief One log line with its metadata
 */
struct structured_log_entry {
    std::string timestamp;  ///< ISO-8601, UTC, millisecond precision
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string;

    /**
     * @brief Render the entry as one JSON object
     *
     * Context fields are flattened into the top-level object.
     */
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto json = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::session)
 *     .with_message("Download completed")
 *     .with_bot_name("Bot")
 *     .with_pack_number("42")
 *     .build_json();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder();

    auto with_level(log_level level) -> log_entry_builder&;
    auto with_category(std::string_view category) -> log_entry_builder&;
    auto with_message(std::string_view message) -> log_entry_builder&;
    auto with_bot_name(std::string_view bot) -> log_entry_builder&;
    auto with_pack_number(std::string_view pack) -> log_entry_builder&;
    auto with_saved_path(std::string_view path) -> log_entry_builder&;
    auto with_error_message(std::string_view message) -> log_entry_builder&;
    auto with_context(const transfer_log_context& ctx) -> log_entry_builder&;
    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder&;

    [[nodiscard]] auto build() const -> structured_log_entry;
    [[nodiscard]] auto build_json() const -> std::string;

private:
    auto context() -> transfer_log_context&;

    structured_log_entry entry_;
};

/**
 * @brief Process-wide logger for the download client
 */
class xdcc_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    xdcc_logger();
    ~xdcc_logger();

    xdcc_logger(const xdcc_logger&) = delete;
    auto operator=(const xdcc_logger&) -> xdcc_logger& = delete;

    /**
     * @brief Set up the output backend
     *
     * Only the first call has an effect.
     */
    void initialize();

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level;
    [[nodiscard]] auto is_enabled(log_level level) const -> bool;

    void enable_json_output(bool enable = true);
    [[nodiscard]] auto is_json_output_enabled() const -> bool;

    void enable_masking(bool enable = true);

    /**
     * @brief Observe every enabled message before it is written
     */
    void set_callback(log_callback callback);

    /**
     * @brief Observe every rendered JSON line
     *
     * Only called while JSON output is enabled.
     */
    void set_json_callback(json_log_callback callback);

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

    void flush();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Get global logger instance
 */
auto get_logger() -> xdcc_logger&;

#define XC_LOG(level, category, message) \
    kcenon::xdcc_client::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define XC_LOG_CTX(level, category, message, context) \
    kcenon::xdcc_client::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define XC_LOG_TRACE(category, message) \
    XC_LOG(kcenon::xdcc_client::log_level::trace, category, message)

#define XC_LOG_DEBUG(category, message) \
    XC_LOG(kcenon::xdcc_client::log_level::debug, category, message)

#define XC_LOG_INFO(category, message) \
    XC_LOG(kcenon::xdcc_client::log_level::info, category, message)

#define XC_LOG_WARN(category, message) \
    XC_LOG(kcenon::xdcc_client::log_level::warn, category, message)

#define XC_LOG_ERROR(category, message) \
    XC_LOG(kcenon::xdcc_client::log_level::error, category, message)

#define XC_LOG_DEBUG_CTX(category, message, ctx) \
    XC_LOG_CTX(kcenon::xdcc_client::log_level::debug, category, message, ctx)

#define XC_LOG_INFO_CTX(category, message, ctx) \
    XC_LOG_CTX(kcenon::xdcc_client::log_level::info, category, message, ctx)

#define XC_LOG_WARN_CTX(category, message, ctx) \
    XC_LOG_CTX(kcenon::xdcc_client::log_level::warn, category, message, ctx)

#define XC_LOG_ERROR_CTX(category, message, ctx) \
    XC_LOG_CTX(kcenon::xdcc_client::log_level::error, category, message, ctx)

}  // namespace kcenon::xdcc_client
