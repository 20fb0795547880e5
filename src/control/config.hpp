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

// Gangway Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gangway::control {

/// Listener settings
struct ServerConfig {
    // Network settings
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;
    uint32_t backlog = 128;

    // Timeouts (milliseconds)
    uint32_t read_timeout = 30000;      // Request head must arrive within this
    uint32_t write_timeout = 30000;     // Longest wait for a peer to drain a write
    uint32_t shutdown_timeout = 30000;  // Drain period for open sessions on stop

    // Limits
    uint32_t max_connections = 1024;
    uint32_t max_header_size = 8192;  // 8KB

    // TLS settings
    bool tls_enabled = false;
    std::string tls_certificate_path;  // PEM certificate (chain)
    std::string tls_private_key_path;  // PEM private key
};

/// Static file serving
struct StaticFilesConfig {
    std::string root = "/app/static";
    std::vector<std::string> index_files = {"index.html", "index.htm"};
    bool directory_listing = true;
};

/// WebSocket backend (single fixed target)
struct BackendConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8081;
};

/// Byte relay tuning
struct RelayConfig {
    uint32_t poll_interval_ms = 1000;  // Readiness wait per iteration
    uint32_t chunk_size = 4096;        // Max bytes per read
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text"; // json, text (file sink only)
    std::string output;          // Log directory; empty = console only
    bool log_requests = true;
    // Paths not written to the access log. Entries starting with '/' match
    // as prefixes, anything else as suffixes (e.g. ".wasm").
    std::vector<std::string> exclude_paths = {"/pkg/", "/assets/", ".js", ".wasm"};

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Gangway configuration
struct Config {
    ServerConfig server;
    StaticFilesConfig static_files;
    BackendConfig backend;
    RelayConfig relay;

    // Observability
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// All config types use custom from_json/to_json so missing fields keep
// their defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    const ServerConfig defaults;
    s.listen_address = j.value("listen_address", defaults.listen_address);
    s.listen_port = j.value("listen_port", defaults.listen_port);
    s.backlog = j.value("backlog", defaults.backlog);
    s.read_timeout = j.value("read_timeout", defaults.read_timeout);
    s.write_timeout = j.value("write_timeout", defaults.write_timeout);
    s.shutdown_timeout = j.value("shutdown_timeout", defaults.shutdown_timeout);
    s.max_connections = j.value("max_connections", defaults.max_connections);
    s.max_header_size = j.value("max_header_size", defaults.max_header_size);
    s.tls_enabled = j.value("tls_enabled", false);
    s.tls_certificate_path = j.value("tls_certificate_path", std::string());
    s.tls_private_key_path = j.value("tls_private_key_path", std::string());
}

inline void from_json(const nlohmann::json& j, StaticFilesConfig& s) {
    const StaticFilesConfig defaults;
    s.root = j.value("root", defaults.root);
    s.index_files = j.value("index_files", defaults.index_files);
    s.directory_listing = j.value("directory_listing", defaults.directory_listing);
}

inline void from_json(const nlohmann::json& j, BackendConfig& b) {
    const BackendConfig defaults;
    b.host = j.value("host", defaults.host);
    b.port = j.value("port", defaults.port);
}

inline void from_json(const nlohmann::json& j, RelayConfig& r) {
    const RelayConfig defaults;
    r.poll_interval_ms = j.value("poll_interval_ms", defaults.poll_interval_ms);
    r.chunk_size = j.value("chunk_size", defaults.chunk_size);
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    const LogConfig defaults;
    l.level = j.value("level", defaults.level);
    l.format = j.value("format", defaults.format);
    l.output = j.value("output", defaults.output);
    l.log_requests = j.value("log_requests", defaults.log_requests);
    l.exclude_paths = j.value("exclude_paths", defaults.exclude_paths);
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // contains() + get_to() keeps defaults for absent sections
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("static_files")) {
        j.at("static_files").get_to(c.static_files);
    }
    if (j.contains("backend")) {
        j.at("backend").get_to(c.backend);
    }
    if (j.contains("relay")) {
        j.at("relay").get_to(c.relay);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
    if (j.contains("description")) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"read_timeout", s.read_timeout},
                       {"write_timeout", s.write_timeout},
                       {"shutdown_timeout", s.shutdown_timeout},
                       {"max_connections", s.max_connections},
                       {"max_header_size", s.max_header_size},
                       {"tls_enabled", s.tls_enabled},
                       {"tls_certificate_path", s.tls_certificate_path},
                       {"tls_private_key_path", s.tls_private_key_path}};
}

inline void to_json(nlohmann::json& j, const StaticFilesConfig& s) {
    j = nlohmann::json{{"root", s.root},
                       {"index_files", s.index_files},
                       {"directory_listing", s.directory_listing}};
}

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    j = nlohmann::json{{"host", b.host}, {"port", b.port}};
}

inline void to_json(nlohmann::json& j, const RelayConfig& r) {
    j = nlohmann::json{{"poll_interval_ms", r.poll_interval_ms}, {"chunk_size", r.chunk_size}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"log_requests", l.log_requests},
                       {"exclude_paths", l.exclude_paths},
                       {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["server"] = c.server;
    j["static_files"] = c.static_files;
    j["backend"] = c.backend;
    j["relay"] = c.relay;
    j["logging"] = c.logging;
    j["version"] = c.version;
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Environment lookup used for overrides; returns nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Reads the process environment
[[nodiscard]] std::optional<std::string> process_env(std::string_view name);

/// Split "host:port"; nullopt if the port is missing or out of range
[[nodiscard]] std::optional<std::pair<std::string, uint16_t>> parse_host_port(
    std::string_view value);

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Apply GANGWAY_LISTEN_ADDR, GANGWAY_STATIC_ROOT, GANGWAY_BACKEND_ADDR and
    /// GANGWAY_LOG_LEVEL on top of config. Malformed values are reported as errors.
    [[nodiscard]] static ValidationResult apply_env_overrides(Config& config,
                                                              const EnvLookup& lookup = process_env);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace gangway::control
