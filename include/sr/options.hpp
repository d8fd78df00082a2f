#pragma once

#include <string>
#include <vector>

#include "sr/llmnr.hpp"

namespace sr
{
struct Options
{
    std::vector<std::string> servers;   // positional server addresses
    std::vector<std::string> paths;     // --path values to normalize
    int timeout_ms = 10000;             // per-server resolution budget
    bool connect = false;               // dial the SMB port after resolving
    bool multicast = true;              // LLMNR tiers
    LlmnrConfig llmnr;                  // group/port overrides
    std::string llmnr_if;               // interface name for the IPv6 group
    int concurrency = 1;                // servers resolved in parallel
    bool json = false;                  // JSON output mode
    bool verbose = false;               // per-tier attempts in text mode
};
} // namespace sr
