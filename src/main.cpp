/*
 * Copyright 2026 Gangway Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Gangway - Main Entry Point
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server.hpp"
#include "core/tls.hpp"

namespace {

void print_usage(const char* argv0) {
    fprintf(stderr, "Usage: %s [--config <config.json>]\n", argv0);
    fprintf(stderr, "\nEnvironment overrides:\n");
    fprintf(stderr, "  GANGWAY_LISTEN_ADDR   host:port to listen on (default 0.0.0.0:8080)\n");
    fprintf(stderr, "  GANGWAY_STATIC_ROOT   directory served as static files (default /app/static)\n");
    fprintf(stderr, "  GANGWAY_BACKEND_ADDR  WebSocket backend host:port (default 127.0.0.1:8081)\n");
    fprintf(stderr, "  GANGWAY_LOG_LEVEL     debug, info, warning or error\n");
}

void print_validation(const gangway::control::ValidationResult& validation) {
    for (const auto& error : validation.errors) {
        fprintf(stderr, "  - error: %s\n", error.c_str());
    }
    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "  - warning: %s\n", warning.c_str());
    }
}

}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        gangway::core::g_server_running = false;
    }
}

int main(int argc, char* argv[]) {
    printf("Gangway v1.0.0\n");
    printf("Static files and WebSocket relay on one port\n\n");

    std::optional<std::string> config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    gangway::control::Config config;
    if (config_path) {
        printf("Loading configuration from %s...\n", config_path->c_str());
        auto loaded = gangway::control::ConfigLoader::load_from_file(*config_path);
        if (!loaded) {
            fprintf(stderr, "Failed to load configuration\n");
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }

    auto env_result = gangway::control::ConfigLoader::apply_env_overrides(config);
    auto validation = gangway::control::ConfigLoader::validate(config);
    if (env_result.has_errors() || validation.has_errors()) {
        fprintf(stderr, "Configuration validation errors:\n");
        print_validation(env_result);
        print_validation(validation);
        return EXIT_FAILURE;
    }
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        print_validation(validation);
    }

    if (auto tls_ec = gangway::core::initialize_openssl(); tls_ec) {
        fprintf(stderr, "Failed to initialize OpenSSL: %s\n", tls_ec.message().c_str());
        return EXIT_FAILURE;
    }
    gangway::logging::init_logging_system();
    quill::Logger* logger = nullptr;
    try {
        logger = gangway::logging::init_logger(config.logging);
    } catch (const std::exception& e) {
        // Unwritable log directory or file sink failure
        fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        quill::Backend::stop();
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGPIPE, SIG_IGN);         // TLS writes go through write(2)

    printf("Listening on %s:%u, serving %s, relaying WebSocket upgrades to %s:%u\n",
           config.server.listen_address.c_str(), config.server.listen_port,
           config.static_files.root.c_str(), config.backend.host.c_str(), config.backend.port);

    std::error_code ec;
    {
        gangway::core::Server server(config);
        ec = server.start();
        if (!ec) {
            ec = server.run();
        }
    }

    if (ec) {
        LOG_ERROR(logger, "Server error: {}", ec.message());
        fprintf(stderr, "Server error: %s\n", ec.message().c_str());
        gangway::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    printf("Gangway stopped.\n");
    gangway::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
