#include "sr/engine.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <memory>
#include <utility>

#include "sr/address.hpp"
#include "sr/resolver.hpp"

namespace sr {

namespace {

constexpr std::string_view kLocalSuffix = ".local";

std::string with_local_suffix(const std::string& hostname)
{
    std::string out = hostname;
    if (!out.empty() && out.back() == '.') out.pop_back();
    out += kLocalSuffix;
    return out;
}

double elapsed_ms(const Clock::time_point t0)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

// Prefer the last tier that actually ran; skipped tiers only carry a
// deadline placeholder.
ResolveError aggregate_error(const std::string& hostname,
                             const std::vector<TierAttempt>& attempts)
{
    const ResolveError* cause = nullptr;
    for (auto it = attempts.rbegin(); it != attempts.rend(); ++it)
    {
        if (!it->error) continue;
        if (!cause) cause = &it->error;
        if (!it->skipped)
        {
            cause = &it->error;
            break;
        }
    }

    ResolveError e{};
    e.kind = ResolveErrorKind::Aggregate;
    if (!cause)
    {
        e.cause_kind = ResolveErrorKind::NoAddresses;
        e.cause = std::format("no IP addresses found for {}", hostname);
        e.message = e.cause;
        return e;
    }
    e.cause_kind = cause->kind;
    e.cause = cause->message;
    e.rc = cause->rc;
    e.message = std::format("resolve {}: {}", hostname, cause->message);
    return e;
}

} // namespace

bool has_local_suffix(const std::string& hostname)
{
    std::string_view h = hostname;
    if (!h.empty() && h.back() == '.') h.remove_suffix(1);
    if (h.size() < kLocalSuffix.size()) return false;
    const auto tail = h.substr(h.size() - kLocalSuffix.size());
    return std::ranges::equal(tail, kLocalSuffix, [](unsigned char a, unsigned char b)
    {
        return std::tolower(a) == b;
    });
}

HostResolver::HostResolver(LlmnrConfig config)
{
    auto multicast = std::make_shared<MulticastResolver>(std::move(config));
    build_tiers(lookup_unicast,
                [multicast](const Budget& budget,
                            const std::string& hostname,
                            std::chrono::milliseconds timeout)
                {
                    return multicast->lookup(budget, hostname, timeout);
                });
}

HostResolver::HostResolver(UnicastFn unicast, MulticastFn multicast)
{
    build_tiers(std::move(unicast), std::move(multicast));
}

void HostResolver::build_tiers(UnicastFn unicast, MulticastFn multicast)
{
    std::function<LookupResult(const Budget&, const std::string&)> uni;
    std::function<LookupResult(const Budget&, const std::string&)> multi;
    if (unicast) uni = std::move(unicast);
    if (multicast)
    {
        // multicast tiers get whatever is left of the shared deadline
        multi = [fn = std::move(multicast)](const Budget& budget, const std::string& hostname)
        {
            return fn(budget, hostname, budget.remaining());
        };
    }

    tiers_.clear();
    tiers_.push_back({"unicast", false, false, uni});
    tiers_.push_back({"unicast-local", true, false, uni});
    tiers_.push_back({"multicast", false, true, multi});
    tiers_.push_back({"multicast-local", true, true, multi});
}

ResolveResult HostResolver::resolve(const std::string& hostname,
                                    std::chrono::milliseconds timeout,
                                    const std::atomic<bool>* cancel) const
{
    ResolveResult out{};
    out.host = hostname;
    const auto t0 = Clock::now();

    if (hostname.empty())
    {
        out.error.kind = ResolveErrorKind::EmptyAddress;
        out.error.message = "host name is required";
        return out;
    }

    // literal: no tier runs, no network I/O
    if (auto literal = parse_ip_literal(hostname))
    {
        out.addresses.push_back(std::move(*literal));
        out.ms = elapsed_ms(t0);
        return out;
    }

    if (timeout.count() <= 0) timeout = kDefaultResolveTimeout;
    const Budget budget = Budget::after(timeout, cancel);
    const bool already_local = has_local_suffix(hostname);

    std::vector<Address> collected;
    for (const auto& tier : tiers_)
    {
        if (!tier.lookup) continue;
        if (tier.multicast && !multicast_enabled_) continue;
        if (tier.local_suffix && already_local) continue;

        TierAttempt at{};
        at.strategy = tier.name;
        at.hostname = tier.local_suffix ? with_local_suffix(hostname) : hostname;

        if (budget.expired())
        {
            at.skipped = true;
            at.error.kind = ResolveErrorKind::Cancelled;
            at.error.message = std::format("{} {}: {}",
                                           tier.name,
                                           at.hostname,
                                           budget.cancelled()
                                               ? "operation cancelled"
                                               : "deadline exceeded");
            out.attempts.push_back(std::move(at));
            continue;
        }

        LookupResult r = tier.lookup(budget, at.hostname);
        at.ms = r.ms;
        at.addresses = std::move(r.addresses);
        at.error = std::move(r.error);
        const bool produced = !at.addresses.empty();
        collected.insert(collected.end(), at.addresses.begin(), at.addresses.end());
        out.attempts.push_back(std::move(at));
        if (produced) break;
    }

    out.addresses = dedupe_addresses(std::move(collected));
    if (out.addresses.empty()) out.error = aggregate_error(hostname, out.attempts);
    out.ms = elapsed_ms(t0);
    return out;
}

} // namespace sr
