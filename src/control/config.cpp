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

// Gangway Configuration - Implementation

#include "config.hpp"

#include <arpa/inet.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace gangway::control {

namespace {

// Timeouts end up as poll(2) arguments; keep them well inside int range
constexpr uint32_t kMaxTimeoutMs = 3600000;   // 1 hour
constexpr uint32_t kMaxPollIntervalMs = 60000;

}  // namespace

std::optional<std::string> process_env(std::string_view name) {
    std::string name_str{name};
    const char* value = std::getenv(name_str.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::pair<std::string, uint16_t>> parse_host_port(std::string_view value) {
    size_t colon = value.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= value.size()) {
        return std::nullopt;
    }

    std::string_view port_str = value.substr(colon + 1);
    uint32_t port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 ||
        port > 65535) {
        return std::nullopt;
    }

    return std::make_pair(std::string(value.substr(0, colon)), static_cast<uint16_t>(port));
}

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::apply_env_overrides(Config& config, const EnvLookup& lookup) {
    ValidationResult result;

    if (auto listen = lookup("GANGWAY_LISTEN_ADDR")) {
        if (auto parsed = parse_host_port(*listen)) {
            config.server.listen_address = parsed->first;
            config.server.listen_port = parsed->second;
        } else {
            result.add_error("GANGWAY_LISTEN_ADDR must be host:port, got '" + *listen + "'");
        }
    }

    if (auto root = lookup("GANGWAY_STATIC_ROOT")) {
        if (root->empty()) {
            result.add_error("GANGWAY_STATIC_ROOT cannot be empty");
        } else {
            config.static_files.root = *root;
        }
    }

    if (auto backend = lookup("GANGWAY_BACKEND_ADDR")) {
        if (auto parsed = parse_host_port(*backend)) {
            config.backend.host = parsed->first;
            config.backend.port = parsed->second;
        } else {
            result.add_error("GANGWAY_BACKEND_ADDR must be host:port, got '" + *backend + "'");
        }
    }

    if (auto level = lookup("GANGWAY_LOG_LEVEL")) {
        config.logging.level = *level;
    }

    return result;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }

    in_addr addr{};
    if (inet_pton(AF_INET, config.server.listen_address.c_str(), &addr) != 1) {
        result.add_error("Server listen_address must be an IPv4 address: '" +
                         config.server.listen_address + "'");
    }

    if (config.server.max_header_size == 0) {
        result.add_error("Server max_header_size must be > 0");
    }

    if (config.server.max_connections == 0) {
        result.add_error("Server max_connections must be > 0");
    }

    if (config.server.read_timeout == 0 || config.server.write_timeout == 0) {
        result.add_error("Server read_timeout and write_timeout must be > 0");
    }

    if (config.server.read_timeout > kMaxTimeoutMs || config.server.write_timeout > kMaxTimeoutMs ||
        config.server.shutdown_timeout > kMaxTimeoutMs) {
        result.add_error("Server timeouts must be <= " + std::to_string(kMaxTimeoutMs) + " ms");
    }

    if (config.server.shutdown_timeout < config.server.write_timeout) {
        result.add_warning(
            "Server shutdown_timeout is shorter than write_timeout (a stalled write can outlive "
            "the drain period)");
    }

    if (config.server.tls_enabled) {
        if (config.server.tls_certificate_path.empty()) {
            result.add_error("TLS enabled but tls_certificate_path is empty");
        }
        if (config.server.tls_private_key_path.empty()) {
            result.add_error("TLS enabled but tls_private_key_path is empty");
        }
    }

    // Static files
    if (config.static_files.root.empty()) {
        result.add_error("static_files.root cannot be empty");
    }

    for (const auto& index : config.static_files.index_files) {
        if (index.empty() || index.find('/') != std::string::npos) {
            result.add_error("static_files.index_files entries must be plain file names: '" +
                             index + "'");
        }
    }

    // Backend
    if (config.backend.host.empty()) {
        result.add_error("Backend host cannot be empty");
    }

    if (config.backend.port == 0) {
        result.add_error("Backend port must be > 0");
    }

    if (config.backend.host == config.server.listen_address &&
        config.backend.port == config.server.listen_port) {
        result.add_error("Backend address equals the listen address (relay would loop)");
    }

    // Relay
    if (config.relay.chunk_size == 0) {
        result.add_error("Relay chunk_size must be > 0");
    }

    if (config.relay.poll_interval_ms == 0) {
        result.add_warning("Relay poll_interval_ms is 0 (relay threads will spin)");
    }

    if (config.relay.poll_interval_ms > kMaxPollIntervalMs) {
        result.add_error("Relay poll_interval_ms must be <= " + std::to_string(kMaxPollIntervalMs));
    }

    // Logging
    static constexpr std::string_view kLevels[] = {"debug", "info", "warning", "warn", "error"};
    bool level_known = false;
    for (auto level : kLevels) {
        if (config.logging.level == level) {
            level_known = true;
        }
    }
    if (!level_known) {
        result.add_warning("Unknown logging.level '" + config.logging.level + "', using info");
    }

    if (config.logging.format != "text" && config.logging.format != "json") {
        result.add_error("logging.format must be 'text' or 'json'");
    }

    for (const auto& path : config.logging.exclude_paths) {
        if (path.empty()) {
            result.add_warning("Empty entry in logging.exclude_paths ignored");
        }
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace gangway::control
