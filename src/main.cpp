#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "kernel/config.hpp"
#include "kernel/kernel.hpp"
#include "util/logger.hpp"
#include <filesystem>
#include <iostream>

// ANSI escape codes
namespace term {
    constexpr const char* RESET     = "\033[0m";
    constexpr const char* BOLD      = "\033[1m";
    constexpr const char* DIM       = "\033[2m";
    constexpr const char* CYAN      = "\033[36m";
    constexpr const char* GREEN     = "\033[32m";
    constexpr const char* YELLOW    = "\033[33m";
    constexpr const char* MAGENTA   = "\033[35m";
    constexpr const char* WHITE     = "\033[37m";
}

constexpr const char* DEFAULT_CONFIG_PATH = "config/config.json";

void print_banner() {
    std::cout << term::CYAN << term::BOLD;
    std::cout << R"(
    ╔═══════════════════════════════════════════════════════════╗
    ║                                                           ║
    ║    ██████╗  ██████╗ ██╗   ██╗ █████╗                      ║
    ║    ██╔══██╗██╔═══██╗╚██╗ ██╔╝██╔══██╗                     ║
    ║    ██████╔╝██║   ██║ ╚████╔╝ ███████║                     ║
    ║    ██╔══██╗██║   ██║  ╚██╔╝  ██╔══██║                     ║
    ║    ██║  ██║╚██████╔╝   ██║   ██║  ██║                     ║
    ║    ╚═╝  ╚═╝ ╚═════╝    ╚═╝   ╚═╝  ╚═╝                     ║
    ║                      )" << term::RESET << term::DIM << "  ██████╗ ███████╗" << term::CYAN << term::BOLD << R"(            ║
    ║                      )" << term::RESET << term::DIM << " ██╔═══██╗██╔════╝" << term::CYAN << term::BOLD << R"(            ║
    ║                      )" << term::RESET << term::DIM << " ██║   ██║███████╗" << term::CYAN << term::BOLD << R"(            ║
    ║                      )" << term::RESET << term::DIM << " ██║   ██║╚════██║" << term::CYAN << term::BOLD << R"(            ║
    ║                      )" << term::RESET << term::DIM << " ╚██████╔╝███████║" << term::CYAN << term::BOLD << R"(            ║
    ║                      )" << term::RESET << term::DIM << "  ╚═════╝ ╚══════╝" << term::CYAN << term::BOLD << R"(            ║
    ║                                                           ║
    ╚═══════════════════════════════════════════════════════════╝
)" << term::RESET;
}

// One "│  Label  value   │" row, padded to the box width
void print_status_row(const char* label, const char* color, const std::string& value) {
    std::cout << "    │" << term::RESET << "  " << label << color << value;
    int padding = 43 - static_cast<int>(value.length());
    for (int i = 0; i < padding; i++) std::cout << " ";
    std::cout << term::WHITE << term::BOLD << "│\n";
}

void print_status_box(const royaos::kernel::Kernel& kernel) {
    const auto& config = kernel.get_config();

    std::cout << term::WHITE << term::BOLD;
    std::cout << "\n    ┌─────────────────────────────────────────────────────────┐\n";
    std::cout << "    │" << term::RESET << term::CYAN << "  KERNEL STATUS" << term::RESET
              << term::WHITE << term::BOLD << "                                          │\n";
    std::cout << "    ├─────────────────────────────────────────────────────────┤\n";

    print_status_row("Version     ", term::GREEN, "v" + config.system_version);
    print_status_row("Socket      ", term::YELLOW, config.socket_path);
    print_status_row("Security    ", term::MAGENTA,
        royaos::kernel::security_level_to_string(config.security_level));
    print_status_row("Memory      ", term::GREEN,
        fmt::format("{} MB, {}", config.memory.max_allocation_bytes / (1024 * 1024),
            royaos::kernel::optimization_strategy_to_string(config.memory.optimization_strategy)));
    print_status_row("Data dir    ", term::YELLOW, config.data_dir);

    std::cout << "    └─────────────────────────────────────────────────────────┘\n" << term::RESET;
}

void print_ready_message() {
    std::cout << "\n" << term::GREEN << term::BOLD;
    std::cout << "    ══════════════════════════════════════════════════════════\n";
    std::cout << "      KERNEL READY" << term::RESET << term::DIM << "  ·  Press Ctrl+C to shutdown\n";
    std::cout << term::GREEN << term::BOLD;
    std::cout << "    ══════════════════════════════════════════════════════════\n";
    std::cout << term::RESET << "\n";
}

int main(int argc, char** argv) {
    print_banner();

    royaos::util::init_logger();

    // Load configuration: explicit path, then config/config.json, then defaults
    royaos::kernel::Kernel::Config config;
    try {
        if (argc > 1) {
            config = royaos::kernel::load_config(argv[1]);
        } else if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) {
            config = royaos::kernel::load_config(DEFAULT_CONFIG_PATH);
        } else {
            spdlog::info("No config file found, using defaults");
        }
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }
    royaos::util::set_log_level(royaos::util::parse_log_level(config.log_level));

    try {
        royaos::kernel::Kernel kernel(config);

        if (!kernel.init()) {
            std::cout << "\n    " << term::BOLD << "\033[31m✗" << term::RESET
                      << "  Failed to initialize kernel\n\n";
            return 1;
        }

        print_status_box(kernel);
        print_ready_message();

        // Run (blocks until Ctrl+C or system_shutdown)
        kernel.run();
    } catch (const std::exception& e) {
        spdlog::critical("Kernel failed: {}", e.what());
        return 1;
    }

    std::cout << "\n    " << term::YELLOW << "⟳" << term::RESET
              << "  Shut down gracefully\n\n";
    return 0;
}
