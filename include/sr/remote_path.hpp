#pragma once

#include <string>
#include <string_view>

namespace sr {

// Canonical share-relative path: forward slashes, no leading slash,
// no "." / ".." segments, "." for the share root. ".." never climbs
// above the root.
std::string normalize_remote_path(std::string_view path);

} // namespace sr
