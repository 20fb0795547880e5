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

// Gangway Access Log - Implementation

#include "access_log.hpp"

#include "../core/logging.hpp"

namespace gangway::gateway {

AccessLog::AccessLog(quill::Logger* logger, bool enabled, std::vector<std::string> exclude_paths)
    : logger_(logger), enabled_(enabled), exclude_paths_(std::move(exclude_paths)) {}

bool AccessLog::should_log(std::string_view path) const noexcept {
    if (!enabled_) {
        return false;
    }

    for (const auto& pattern : exclude_paths_) {
        if (pattern.empty()) {
            continue;
        }
        if (pattern.front() == '/') {
            if (path.starts_with(pattern)) {
                return false;
            }
        } else if (path.ends_with(pattern)) {
            return false;
        }
    }

    return true;
}

void AccessLog::record(const RequestRecord& record) const {
    if (logger_ == nullptr || !should_log(record.path)) {
        return;
    }

    LOG_REQUEST(logger_, record.method, record.path, record.status, record.duration_us,
                record.client, record.correlation_id);
}

}  // namespace gangway::gateway
