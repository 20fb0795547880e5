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

// Gangway Request Classifier - Implementation

#include "classifier.hpp"

namespace gangway::gateway {

bool is_websocket_upgrade(const http::Request& request) noexcept {
    const http::Header* upgrade = request.find_header("Upgrade");
    if (upgrade == nullptr) {
        return false;
    }
    return http::header_name_equals(http::trim(upgrade->value), "websocket");
}

Route classify(const http::Request& request) noexcept {
    return is_websocket_upgrade(request) ? Route::Relay : Route::StaticFiles;
}

std::string_view to_string(Route route) noexcept {
    switch (route) {
        case Route::StaticFiles:
            return "static";
        case Route::Relay:
            return "relay";
    }
    return "unknown";
}

}  // namespace gangway::gateway
