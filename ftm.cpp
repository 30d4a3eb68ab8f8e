// ftm.cpp - Dual-pane terminal FTP file manager
#include <iostream>
#include <clocale>
#include <string>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "ftm_core.h"
#include "ftm_session.h"
#include "ftm_transfer.h"
#include "ftm_ui.h"

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] [ftp://HOST[:PORT]]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version information\n\n";
    std::cout << "The server argument overrides the host and port saved in\n";
    std::cout << default_config_path().string() << ". A bare HOST[:PORT] is accepted too.\n";
}

void print_version() {
    std::cout << "ftm " << FTM_VERSION << "\n";
}

int main(int argc, char* argv[]) {
    std::setlocale(LC_ALL, "");

    init_logging(default_log_path());
    Config config = load_config(default_config_path());

    // Parse command-line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage(argv[0]);
            return 1;
        } else if (!apply_server_argument(arg, config.server)) {
            std::cerr << "Error: Invalid server address: " << arg << "\n";
            return 1;
        }
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Error: Cannot initialize libcurl\n";
        return 1;
    }

    spdlog::info("ftm {} starting, server {}:{}", FTM_VERSION, config.server.host, config.server.port);

    int status = 0;
    try {
        Session session(curl_client_factory());
        TransferEngine engine(curl_client_factory(), config.transfer_timeout);

        InteractiveUI ui(config, session, engine);
        ui.run();
    } catch (const FtmError& e) {
        spdlog::error("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    spdlog::info("ftm exiting");
    curl_global_cleanup();
    return status;
}
