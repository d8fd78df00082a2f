#include "sr/address.hpp"

#include <unordered_set>

namespace sr {

std::vector<Address> dedupe_addresses(std::vector<Address> addresses)
{
    if (addresses.size() < 2)
    {
        if (!addresses.empty() && !addresses.front().valid()) addresses.clear();
        return addresses;
    }

    std::vector<Address> out;
    out.reserve(addresses.size());
    std::unordered_set<std::string> seen;
    for (auto& a : addresses)
    {
        if (!a.valid()) continue;
        if (!seen.insert(a.ip).second) continue;
        out.push_back(std::move(a));
    }
    return out;
}

} // namespace sr
