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

// Gangway Access Log - Header
// Per-request completion lines with path-based suppression

#pragma once

#include <quill/Logger.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gangway::gateway {

struct RequestRecord {
    std::string_view method;
    std::string_view path;
    uint16_t status = 0;
    uint64_t duration_us = 0;
    std::string_view client;
    std::string_view correlation_id;
};

class AccessLog {
public:
    AccessLog(quill::Logger* logger, bool enabled, std::vector<std::string> exclude_paths);

    /// False for paths matching an exclusion: entries starting with '/' are
    /// prefixes, all others are suffixes
    [[nodiscard]] bool should_log(std::string_view path) const noexcept;

    void record(const RequestRecord& record) const;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

private:
    quill::Logger* logger_;
    bool enabled_;
    std::vector<std::string> exclude_paths_;
};

}  // namespace gangway::gateway
