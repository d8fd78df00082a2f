#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "sr/budget.hpp"
#include "sr/llmnr.hpp"
#include "sr/model.hpp"

namespace sr {

using UnicastFn = std::function<LookupResult(const Budget&, const std::string&)>;
using MulticastFn = std::function<LookupResult(const Budget&,
                                               const std::string&,
                                               std::chrono::milliseconds)>;

inline constexpr std::chrono::milliseconds kDefaultResolveTimeout{3000};

// Resolves a hostname through an ordered list of tiers sharing one deadline:
//   unicast, unicast-local, multicast, multicast-local
// The first tier producing addresses wins; tier order is preference order.
class HostResolver {
public:
    struct Tier {
        std::string name;
        bool        local_suffix{};   // query "<host>.local" instead of host
        bool        multicast{};
        std::function<LookupResult(const Budget&, const std::string&)> lookup;
    };

    explicit HostResolver(LlmnrConfig config = {});
    HostResolver(UnicastFn unicast, MulticastFn multicast);

    void set_multicast_enabled(bool on) { multicast_enabled_ = on; }

    ResolveResult resolve(const std::string& hostname,
                          std::chrono::milliseconds timeout,
                          const std::atomic<bool>* cancel = nullptr) const;

    const std::vector<Tier>& tiers() const { return tiers_; }

private:
    void build_tiers(UnicastFn unicast, MulticastFn multicast);

    std::vector<Tier> tiers_;
    bool              multicast_enabled_ = true;
};

bool has_local_suffix(const std::string& hostname);

} // namespace sr
