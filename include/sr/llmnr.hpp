#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sr/budget.hpp"
#include "sr/model.hpp"

namespace sr {

// Link-Local Multicast Name Resolution (RFC 4795) endpoints.
// An empty group disables that address family.
struct LlmnrConfig {
    std::string ipv4_group = "224.0.0.252";
    std::string ipv6_group = "ff02::1:3";
    uint16_t    port = 5355;
    unsigned    ipv6_scope_id = 0;   // interface index for the link-local group
};

inline constexpr std::chrono::milliseconds kMinMulticastTimeout{500};

struct QueryPacket {
    std::vector<uint8_t> wire;
    uint16_t             id{};
    ResolveError         error;
};

// Two questions (A, AAAA, class IN) for `name` + ".", RD cleared.
QueryPacket build_llmnr_query(const std::string& name);

// nullopt when the datagram is not a well-formed response (or answers a
// different query id when expected_id >= 0). Otherwise the A/AAAA records
// of the answer section, possibly empty.
std::optional<std::vector<Address>> parse_llmnr_response(const uint8_t* data,
                                                         size_t size,
                                                         int expected_id = -1);

class MulticastResolver {
public:
    explicit MulticastResolver(LlmnrConfig config = {});

    // Sends the query to both groups and collects answers until `timeout`
    // (clamped to kMinMulticastTimeout when not positive) elapses.
    LookupResult lookup(const Budget& budget,
                        const std::string& hostname,
                        std::chrono::milliseconds timeout) const;

    const LlmnrConfig& config() const { return config_; }

private:
    LlmnrConfig config_;
};

} // namespace sr
