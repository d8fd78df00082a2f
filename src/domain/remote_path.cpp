#include "sr/remote_path.hpp"

#include <vector>

namespace sr {

std::string normalize_remote_path(std::string_view path)
{
    // Resolve as if rooted at the share: "." and empty segments vanish,
    // ".." pops a segment and stops at the root.
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size())
    {
        size_t end = start;
        while (end < path.size() && path[end] != '/' && path[end] != '\\') ++end;
        const std::string_view seg = path.substr(start, end - start);
        if (seg.empty() || seg == ".")
        {
            // skip
        }
        else if (seg == "..")
        {
            if (!segments.empty()) segments.pop_back();
        }
        else
        {
            segments.push_back(seg);
        }
        start = end + 1;
    }

    if (segments.empty()) return ".";

    std::string out;
    for (const auto& seg : segments)
    {
        if (!out.empty()) out += '/';
        out.append(seg);
    }
    return out;
}

} // namespace sr
