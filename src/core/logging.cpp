// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.cpp
 * @brief Structured logging implementation
 */

#include "kcenon/xdcc_client/core/logging.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

#if XDCC_CLIENT_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::xdcc_client {

namespace {

using ordered_json = nlohmann::ordered_json;

enum class clock_zone { utc, local };

auto format_timestamp(clock_zone zone, const char* pattern, bool with_zulu) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    if (zone == clock_zone::utc) {
        gmtime_s(&tm_buf, &seconds);
    } else {
        localtime_s(&tm_buf, &seconds);
    }
#else
    if (zone == clock_zone::utc) {
        gmtime_r(&seconds, &tm_buf);
    } else {
        localtime_r(&seconds, &tm_buf);
    }
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, pattern)
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (with_zulu) {
        oss << 'Z';
    }
    return oss.str();
}

// Invalid UTF-8 in server-supplied text must not abort a log call.
auto render(const ordered_json& value) -> std::string {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Replaces every regex match with the result of mask_one.
template <typename Masker>
auto replace_matches(const std::string& input, const std::regex& pattern, Masker mask_one)
    -> std::string {
    std::string output;
    std::size_t last = 0;
    for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
        const auto pos = static_cast<std::size_t>(it->position());
        output.append(input, last, pos - last);
        output += mask_one(it->str());
        last = pos + static_cast<std::size_t>(it->length());
    }
    output.append(input, last, std::string::npos);
    return output;
}

void append_context(ordered_json& object,
                    const transfer_log_context& ctx,
                    const sensitive_info_masker* masker) {
    if (!ctx.bot_name.empty()) object["bot_name"] = ctx.bot_name;
    if (!ctx.pack_number.empty()) object["pack_number"] = ctx.pack_number;
    if (!ctx.filename.empty()) {
        object["filename"] = (masker && masker->config().mask_filenames)
            ? masker->mask_path(ctx.filename)
            : ctx.filename;
    }
    if (ctx.progress_percent) object["progress_percent"] = *ctx.progress_percent;
    if (ctx.bytes_received) object["bytes_received"] = *ctx.bytes_received;
    if (ctx.bytes_total) object["bytes_total"] = *ctx.bytes_total;
    if (ctx.rate_bps) object["rate_bps"] = *ctx.rate_bps;
    if (ctx.duration_ms) object["duration_ms"] = *ctx.duration_ms;
    if (ctx.saved_path) {
        object["saved_path"] = masker ? masker->mask_path(*ctx.saved_path) : *ctx.saved_path;
    }
    if (ctx.error_message) {
        object["error_message"] = masker ? masker->mask(*ctx.error_message) : *ctx.error_message;
    }
    if (ctx.server_address) {
        object["server_address"] =
            masker ? masker->mask_ip(*ctx.server_address) : *ctx.server_address;
    }
}

}  // namespace

// ============================================================================
// sensitive_info_masker
// ============================================================================

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    static const std::regex ip_pattern(R"(\b\d{1,3}(?:\.\d{1,3}){3}\b)");
    static const std::regex path_pattern(R"((?:/[A-Za-z0-9._-]+)+)");

    std::string result = input;
    if (config_.mask_ips) {
        result = replace_matches(result, ip_pattern,
            [this](const std::string& ip) { return mask_ip(ip); });
    }
    if (config_.mask_paths) {
        result = replace_matches(result, path_pattern,
            [this](const std::string& path) { return mask_path(path); });
    }
    return result;
}

auto sensitive_info_masker::mask_path(const std::string& path) const -> std::string {
    if (!config_.mask_paths || path.empty()) {
        return path;
    }

    auto sep = path.find_last_of("/\\");
    if (sep == std::string::npos) {
        return config_.mask_filenames ? mask_filename(path) : path;
    }

    std::string name = path.substr(sep + 1);
    if (config_.mask_filenames) {
        name = mask_filename(name);
    }
    return std::string(sep, config_.mask_char) + "/" + name;
}

auto sensitive_info_masker::mask_ip(const std::string& ip) const -> std::string {
    if (!config_.mask_ips || ip.empty()) {
        return ip;
    }

    auto last_dot = ip.find_last_of('.');
    if (last_dot == std::string::npos) {
        return std::string(ip.size(), config_.mask_char);
    }
    return std::string(last_dot, config_.mask_char) + ip.substr(last_dot);
}

auto sensitive_info_masker::mask_filename(const std::string& filename) const -> std::string {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        dot = filename.size();
    }
    if (dot <= config_.visible_chars) {
        return filename;
    }

    std::string masked = filename;
    std::fill(masked.begin() + static_cast<std::ptrdiff_t>(config_.visible_chars),
              masked.begin() + static_cast<std::ptrdiff_t>(dot),
              config_.mask_char);
    return masked;
}

// ============================================================================
// transfer_log_context / structured_log_entry
// ============================================================================

auto transfer_log_context::to_json() const -> std::string {
    return to_json_with_masking(nullptr);
}

auto transfer_log_context::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    ordered_json object = ordered_json::object();
    append_context(object, *this, masker);
    return render(object);
}

auto structured_log_entry::to_json() const -> std::string {
    return to_json_with_masking(nullptr);
}

auto structured_log_entry::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    ordered_json object;
    object["timestamp"] = timestamp;
    object["level"] = std::string(log_level_to_string(level));
    object["category"] = category;
    object["message"] = masker ? masker->mask(message) : message;

    if (context) {
        append_context(object, *context, masker);
    }

    if (source_file) {
        ordered_json source;
        source["file"] = (masker && masker->config().mask_paths)
            ? masker->mask_path(*source_file)
            : *source_file;
        if (source_line) source["line"] = *source_line;
        if (function_name) source["function"] = *function_name;
        object["source"] = std::move(source);
    }

    return render(object);
}

// ============================================================================
// log_entry_builder
// ============================================================================

log_entry_builder::log_entry_builder() {
    entry_.timestamp = format_timestamp(clock_zone::utc, "%Y-%m-%dT%H:%M:%S", true);
}

auto log_entry_builder::with_level(log_level level) -> log_entry_builder& {
    entry_.level = level;
    return *this;
}

auto log_entry_builder::with_category(std::string_view category) -> log_entry_builder& {
    entry_.category = std::string(category);
    return *this;
}

auto log_entry_builder::with_message(std::string_view message) -> log_entry_builder& {
    entry_.message = std::string(message);
    return *this;
}

auto log_entry_builder::with_bot_name(std::string_view bot) -> log_entry_builder& {
    context().bot_name = std::string(bot);
    return *this;
}

auto log_entry_builder::with_pack_number(std::string_view pack) -> log_entry_builder& {
    context().pack_number = std::string(pack);
    return *this;
}

auto log_entry_builder::with_saved_path(std::string_view path) -> log_entry_builder& {
    context().saved_path = std::string(path);
    return *this;
}

auto log_entry_builder::with_error_message(std::string_view message) -> log_entry_builder& {
    context().error_message = std::string(message);
    return *this;
}

auto log_entry_builder::with_context(const transfer_log_context& ctx) -> log_entry_builder& {
    entry_.context = ctx;
    return *this;
}

auto log_entry_builder::with_source_location(const char* file, int line, const char* function)
    -> log_entry_builder& {
    if (file) entry_.source_file = file;
    if (line > 0) entry_.source_line = line;
    if (function) entry_.function_name = function;
    return *this;
}

auto log_entry_builder::build() const -> structured_log_entry {
    return entry_;
}

auto log_entry_builder::build_json() const -> std::string {
    return entry_.to_json();
}

auto log_entry_builder::context() -> transfer_log_context& {
    if (!entry_.context) {
        entry_.context.emplace();
    }
    return *entry_.context;
}

// ============================================================================
// xdcc_logger
// ============================================================================

struct xdcc_logger::impl {
    std::atomic<log_level> min_level{log_level::info};
    std::atomic<bool> initialized{false};
    std::atomic<bool> json_output{false};

    std::mutex config_mutex;
    sensitive_info_masker masker;

    std::mutex callback_mutex;
    log_callback callback;
    json_log_callback json_callback;

    std::mutex stderr_mutex;

#if XDCC_CLIENT_USE_LOGGER_SYSTEM
    std::unique_ptr<kcenon::logger::logger> backend;

    static auto to_backend_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }
#endif

    void write(log_level level, const std::string& line,
               const char* file, int source_line, const char* function) {
#if XDCC_CLIENT_USE_LOGGER_SYSTEM
        if (backend) {
            if (file && source_line > 0 && function) {
                backend->log(to_backend_level(level), line, file, source_line, function);
            } else {
                backend->log(to_backend_level(level), line);
            }
            return;
        }
#else
        (void)level;
        (void)file;
        (void)source_line;
        (void)function;
#endif
        std::lock_guard lock(stderr_mutex);
        std::cerr << line << '\n';
    }
};

xdcc_logger::xdcc_logger() : impl_(std::make_unique<impl>()) {}

xdcc_logger::~xdcc_logger() {
#if XDCC_CLIENT_USE_LOGGER_SYSTEM
    if (impl_->backend) {
        impl_->backend->flush();
        impl_->backend->stop();
    }
#endif
}

void xdcc_logger::initialize() {
    bool expected = false;
    if (!impl_->initialized.compare_exchange_strong(expected, true)) {
        return;
    }

#if XDCC_CLIENT_USE_LOGGER_SYSTEM
    auto result = kcenon::logger::logger_builder()
        .with_async(true)
        .with_min_level(impl::to_backend_level(impl_->min_level.load()))
        .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
        .build();

    if (result) {
        impl_->backend = std::move(result.value());
    }
#endif
}

void xdcc_logger::set_level(log_level level) {
    impl_->min_level.store(level);
#if XDCC_CLIENT_USE_LOGGER_SYSTEM
    if (impl_->backend) {
        impl_->backend->set_min_level(impl::to_backend_level(level));
    }
#endif
}

auto xdcc_logger::get_level() const -> log_level {
    return impl_->min_level.load();
}

auto xdcc_logger::is_enabled(log_level level) const -> bool {
    return static_cast<int>(level) >= static_cast<int>(impl_->min_level.load());
}

void xdcc_logger::enable_json_output(bool enable) {
    impl_->json_output.store(enable);
}

auto xdcc_logger::is_json_output_enabled() const -> bool {
    return impl_->json_output.load();
}

void xdcc_logger::enable_masking(bool enable) {
    std::lock_guard lock(impl_->config_mutex);
    impl_->masker = sensitive_info_masker(
        enable ? masking_config::all_masked() : masking_config::none());
}

void xdcc_logger::set_callback(log_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

void xdcc_logger::set_json_callback(json_log_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->json_callback = std::move(callback);
}

void xdcc_logger::log(log_level level,
                      std::string_view category,
                      std::string_view message,
                      const transfer_log_context* context,
                      const char* file,
                      int line,
                      const char* function) {
    if (!is_enabled(level)) {
        return;
    }

    {
        std::lock_guard lock(impl_->callback_mutex);
        if (impl_->callback) {
            impl_->callback(level, category, message, context);
        }
    }

    sensitive_info_masker masker;
    {
        std::lock_guard lock(impl_->config_mutex);
        masker = impl_->masker;
    }

    if (impl_->json_output.load()) {
        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message)
            .with_source_location(file, line, function);
        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        auto json = entry.to_json_with_masking(&masker);
        {
            std::lock_guard lock(impl_->callback_mutex);
            if (impl_->json_callback) {
                impl_->json_callback(entry, json);
            }
        }
        impl_->write(level, json, file, line, function);
        return;
    }

    std::ostringstream oss;
#if !XDCC_CLIENT_USE_LOGGER_SYSTEM
    oss << format_timestamp(clock_zone::local, "%Y-%m-%d %H:%M:%S", false)
        << " [" << log_level_to_string(level) << "] ";
#endif
    oss << '[' << category << "] " << masker.mask(std::string(message));
    if (context) {
        oss << ' ' << context->to_json_with_masking(&masker);
    }
    impl_->write(level, oss.str(), file, line, function);
}

void xdcc_logger::flush() {
#if XDCC_CLIENT_USE_LOGGER_SYSTEM
    if (impl_->backend) {
        impl_->backend->flush();
        return;
    }
#endif
    std::lock_guard lock(impl_->stderr_mutex);
    std::cerr.flush();
}

auto get_logger() -> xdcc_logger& {
    static xdcc_logger instance;
    return instance;
}

}  // namespace kcenon::xdcc_client
