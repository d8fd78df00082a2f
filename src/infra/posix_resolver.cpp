#include "sr/resolver.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

// POSIX networking
#include <netdb.h>
#include <arpa/inet.h>
#include <sys/socket.h>

#include "sr/address.hpp"

namespace sr
{
namespace
{
// How often a waiting caller re-checks the cancel flag.
constexpr std::chrono::milliseconds kCancelPoll{50};

// Shared between the caller and the getaddrinfo worker. The worker keeps
// its own reference, so a caller that gives up early never leaves it
// writing into freed memory.
struct LookupSlot
{
    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    int rc = 0;
    std::vector<Address> addresses;
};

std::vector<Address> collect_addresses(const addrinfo *res)
{
    std::vector<Address> out;
    for (const addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
        if (ai->ai_family == AF_INET)
        {
            const auto *sin = reinterpret_cast<const sockaddr_in *>(ai->
                ai_addr);
            out.push_back(address_from_bytes(AF_INET, &sin->sin_addr));
        }
        else if (ai->ai_family == AF_INET6)
        {
            const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(ai->
                ai_addr);
            out.push_back(address_from_bytes(AF_INET6, &sin6->sin6_addr));
        }
    }
    std::erase_if(out, [](const Address &a) { return !a.valid(); });
    return out;
}

void run_getaddrinfo(const std::shared_ptr<LookupSlot> &slot,
                     const std::string &hostname)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM; // one entry per address

    addrinfo *res = nullptr;
    const int rc = getaddrinfo(hostname.c_str(), nullptr, &hints, &res);
    std::vector<Address> addresses;
    if (rc == 0) addresses = collect_addresses(res);
    if (res) freeaddrinfo(res);

    {
        std::scoped_lock lk(slot->mtx);
        slot->rc = rc;
        slot->addresses = std::move(addresses);
        slot->done = true;
    }
    slot->cv.notify_all();
}

double elapsed_ms(const Clock::time_point t0)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}
} // namespace

LookupResult lookup_unicast(const Budget &budget, const std::string &hostname)
{
    LookupResult result{};
    const auto t0 = Clock::now();

    if (auto literal = parse_ip_literal(hostname))
    {
        result.addresses.push_back(std::move(*literal));
        result.ms = elapsed_ms(t0);
        return result;
    }

    if (budget.expired())
    {
        result.error.kind = ResolveErrorKind::Cancelled;
        result.error.message = std::format("lookup {}: deadline exceeded", hostname);
        return result;
    }

    auto slot = std::make_shared<LookupSlot>();
    try
    {
        std::thread(run_getaddrinfo, slot, hostname).detach();
    }
    catch (const std::system_error &e)
    {
        result.ms = elapsed_ms(t0);
        result.error.kind = ResolveErrorKind::LookupFailed;
        result.error.message = std::format("lookup {}: {}", hostname, e.what());
        result.error.cause = e.what();
        return result;
    }

    std::unique_lock lk(slot->mtx);
    while (!slot->done && !budget.expired())
    {
        const auto wake = std::min(budget.deadline, Clock::now() + kCancelPoll);
        slot->cv.wait_until(lk, wake);
    }
    result.ms = elapsed_ms(t0);

    if (!slot->done)
    {
        result.error.kind = ResolveErrorKind::Cancelled;
        result.error.message = std::format("lookup {}: {}",
                                           hostname,
                                           budget.cancelled()
                                               ? "operation cancelled"
                                               : "deadline exceeded");
        return result;
    }

    if (slot->rc != 0)
    {
        result.error.kind = ResolveErrorKind::LookupFailed;
        result.error.rc = slot->rc;
        result.error.cause = gai_strerror(slot->rc);
        result.error.message = std::format("lookup {}: {}", hostname, result.error.cause);
        return result;
    }

    result.addresses = std::move(slot->addresses);
    if (result.addresses.empty())
    {
        result.error.kind = ResolveErrorKind::NoAddresses;
        result.error.message = std::format("lookup {}: no addresses returned", hostname);
    }
    return result;
}
} // namespace sr
