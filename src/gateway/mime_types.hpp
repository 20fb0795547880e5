// Gangway MIME Types - Header

#pragma once

#include <string_view>

namespace gangway::gateway {

inline constexpr std::string_view kDefaultMimeType = "application/octet-stream";

/// Content-Type for a file name, by extension (case-insensitive).
/// Unknown or missing extensions map to kDefaultMimeType.
[[nodiscard]] std::string_view mime_type_for(std::string_view filename);

}  // namespace gangway::gateway
