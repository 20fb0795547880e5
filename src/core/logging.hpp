#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace gangway::control {
struct LogConfig;
}

namespace gangway::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the process logger from config: console sink always, plus a rotating
// file sink (text or json) when config.output names a directory.
// The returned logger becomes the one get_current_logger() hands out.
quill::Logger* init_logger(const gangway::control::LogConfig& config);

// Flush and stop the backend (called at exit)
void shutdown_logging();

// UUID v4 based correlation id: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation id format (8-4-4-4-12 UUID v4, '#', decimal counter)
bool is_valid_uuid(std::string_view uuid);

// Process logger; falls back to a console-only logger before init_logger()
quill::Logger* get_current_logger();

// Map "debug", "info", "warning"/"warn", "error" (any case) to a Quill level
quill::LogLevel parse_log_level(std::string_view level);

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

// Backend connection event logging
#define LOG_BACKEND(logger, event, backend_host, backend_port, correlation_id)     \
    LOG_INFO(logger, "Backend {}: backend={}:{}, correlation_id={}", event, backend_host, \
             backend_port, correlation_id)

}  // namespace gangway::logging
