/**
 * @file xdcc_download.cpp
 * @brief Command-line client for the XDCC download server
 *
 * This example demonstrates:
 * - Building a validated session configuration
 * - Displaying progress with throughput and remaining time
 * - Cancelling a running session from a signal handler
 * - Mapping the session outcome to the process exit code
 */

#include <kcenon/xdcc_client/xdcc_client.h>
#include <kcenon/xdcc_client/core/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

using namespace kcenon::xdcc_client;

namespace {

std::atomic<session_controller*> active_session{nullptr};

constexpr int progress_bar_width = 30;

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

auto format_rate(double bytes_per_second) -> std::string {
    // 2^64 as a double
    constexpr double max_rate = 18446744073709551616.0;
    uint64_t rate = 0;
    if (bytes_per_second >= max_rate) {
        rate = std::numeric_limits<uint64_t>::max();
    } else if (bytes_per_second > 0.0) {
        rate = static_cast<uint64_t>(bytes_per_second);
    }
    return format_bytes(rate) + "/s";
}

auto format_duration(std::chrono::milliseconds duration) -> std::string {
    auto total_seconds = duration.count() / 1000;
    std::ostringstream oss;
    oss << total_seconds / 60 << "m " << std::setw(2) << std::setfill('0')
        << total_seconds % 60 << "s";
    return oss.str();
}

/**
 * @brief Render one progress line in place
 */
void print_progress(const progress_update& update) {
    const auto& message = update.message;
    int filled = message.percent * progress_bar_width / 100;

    std::cout << "\r[";
    for (int i = 0; i < progress_bar_width; ++i) {
        std::cout << (i < filled ? '#' : '-');
    }
    std::cout << "] " << std::setw(3) << message.percent << "% "
              << format_bytes(message.bytes_received) << " / "
              << format_bytes(message.bytes_total) << " "
              << format_rate(update.throughput.rate);
    if (update.remaining) {
        std::cout << " ETA " << format_duration(*update.remaining);
    }
    std::cout << "   " << std::flush;
}

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (auto* session = active_session.load()) {
            session->cancel();
        }
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "XDCC Download Client" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " --bot <name> --pack <number> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --host <host>           Server hostname (default: localhost)" << std::endl;
    std::cout << "  --port <port>           Server port (default: 8080)" << std::endl;
    std::cout << "  --bot <name>            Bot that serves the pack (required)" << std::endl;
    std::cout << "  --pack <number>         Pack number to request (required)" << std::endl;
    std::cout << "  --no-progress           Do not ask the server for progress updates" << std::endl;
    std::cout << "  --timeout <seconds>     Idle timeout while waiting for the server (default: 60)" << std::endl;
    std::cout << "  --threshold <percent>   Percent above which a closed connection counts as done (default: 90)" << std::endl;
    std::cout << "  --json-log              Write log output as JSON" << std::endl;
    std::cout << "  --verbose               Enable debug logging" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --bot CR-HOLLAND|NEW --pack 42" << std::endl;
    std::cout << "  " << program << " --host server.local --port 9000 --bot Bot --pack 7 --timeout 120" << std::endl;
}

/**
 * @brief Parse a whole decimal argument and check it against [min, max]
 */
auto parse_number(const char* option, const std::string& value, long min, long max)
    -> std::optional<long> {
    std::size_t used = 0;
    long number = 0;
    try {
        number = std::stol(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size() || number < min || number > max) {
        std::cerr << "Error: " << option << " expects a whole number from " << min
                  << " to " << max << ", got '" << value << "'" << std::endl;
        return std::nullopt;
    }
    return number;
}

int main(int argc, char* argv[]) {
    // Default configuration
    std::string host = "localhost";
    uint16_t port = 8080;
    std::string bot_name;
    std::string pack_number;
    bool send_progress = true;
    int timeout_seconds = 60;
    int threshold = 90;
    bool json_log = false;
    bool verbose = false;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto next_value = [&](const char* option) -> const char* {
                if (++i >= argc) {
                    std::cerr << "Error: " << option << " requires an argument" << std::endl;
                    return nullptr;
                }
                return argv[i];
            };

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--host") {
                auto value = next_value("--host");
                if (!value) return 1;
                host = value;
            } else if (arg == "--port") {
                auto value = next_value("--port");
                if (!value) return 1;
                auto number = parse_number("--port", value, 1, 65535);
                if (!number) return 1;
                port = static_cast<uint16_t>(*number);
            } else if (arg == "--bot") {
                auto value = next_value("--bot");
                if (!value) return 1;
                bot_name = value;
            } else if (arg == "--pack") {
                auto value = next_value("--pack");
                if (!value) return 1;
                pack_number = value;
            } else if (arg == "--no-progress") {
                send_progress = false;
            } else if (arg == "--timeout") {
                auto value = next_value("--timeout");
                if (!value) return 1;
                auto number = parse_number("--timeout", value, 1,
                                           std::numeric_limits<int>::max());
                if (!number) return 1;
                timeout_seconds = static_cast<int>(*number);
            } else if (arg == "--threshold") {
                auto value = next_value("--threshold");
                if (!value) return 1;
                auto number = parse_number("--threshold", value, 0, 100);
                if (!number) return 1;
                threshold = static_cast<int>(*number);
            } else if (arg == "--json-log") {
                json_log = true;
            } else if (arg == "--verbose") {
                verbose = true;
            } else {
                std::cerr << "Error: unknown option " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Logging
    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(verbose ? log_level::debug : log_level::warn);
    logger.enable_json_output(json_log);

    auto config = session_config_builder()
        .with_server(endpoint{host, port})
        .with_bot_name(bot_name)
        .with_pack_number(pack_number)
        .with_send_progress(send_progress)
        .with_read_timeout(std::chrono::seconds{timeout_seconds})
        .with_completion_threshold(threshold)
        .build();

    if (!config.has_value()) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    session_controller session(config.value());
    bool progress_shown = false;

    session.on_accepted([](const accepted_message& message) {
        std::cout << "Server accepted request: " << message.info << std::endl;
    });

    session.on_progress([&progress_shown](const progress_update& update) {
        progress_shown = true;
        print_progress(update);
    });

    session.on_state_changed([](transfer_phase, transfer_phase to) {
        if (to == transfer_phase::awaiting_response) {
            std::cout << "Waiting for server response..." << std::endl;
        }
    });

    // Set up signal handler
    active_session.store(&session);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "Connecting to " << host << ":" << port << "..." << std::endl;
    std::cout << "Requesting pack #" << pack_number << " from " << bot_name << std::endl;

    auto outcome = session.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    active_session.store(nullptr);

    if (progress_shown) {
        std::cout << std::endl;
    }

    if (!outcome.has_value()) {
        std::cerr << "Error: " << outcome.error().message << std::endl;
        return exit_code_failure;
    }

    const auto& result = outcome.value();
    std::cout << std::endl << result.summary << std::endl;

    if (result.state.success) {
        std::cout << "File: " << result.state.success->filename << std::endl;
        std::cout << "Size: " << format_bytes(result.state.success->size_bytes) << std::endl;
        std::cout << "Saved to: " << result.state.success->saved_path << std::endl;
    }

    return result.exit_code;
}
