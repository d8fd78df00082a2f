#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sr/model.hpp"

namespace sr {

inline constexpr std::string_view kDefaultSmbPort = "445";

// Parses a numeric IPv4/IPv6 literal (no zone, no brackets).
std::optional<Address> parse_ip_literal(std::string_view text);

// Builds an Address from raw network-order bytes (4 for AF_INET, 16 for AF_INET6).
Address address_from_bytes(int af, const void* bytes);

// Splits a user supplied server address into host and port (default 445).
ParseResult parse_server_address(std::string_view address);

// "host:port", bracketing IPv6 literals
std::string join_host_port(const std::string& host, const std::string& port);

// Drops invalid entries and folds duplicates by canonical string, keeping
// the first occurrence.
std::vector<Address> dedupe_addresses(std::vector<Address> addresses);

} // namespace sr
