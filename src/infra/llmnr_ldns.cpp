#include "sr/llmnr.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <ldns/ldns.h>

#include "sr/address.hpp"
#include "infra/socket_fd.hpp"

namespace sr
{
namespace
{
using PktPtr = std::unique_ptr<ldns_pkt, decltype(&ldns_pkt_free)>;

// Upper bound for one poll() so a raised cancel flag is seen promptly.
constexpr std::chrono::milliseconds kCancelPoll{100};

ResolveError socket_error(const std::string &what, int err)
{
    ResolveError e{};
    e.kind = ResolveErrorKind::Socket;
    e.rc = err;
    e.cause = std::strerror(err);
    e.message = std::format("llmnr {}: {}", what, e.cause);
    return e;
}

double elapsed_ms(const Clock::time_point t0)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

// Dual-stack IPv6 socket when available so both groups share one port;
// IPv4 only otherwise.
SocketFd open_query_socket(int &family, ResolveError &err)
{
    SocketFd fd(::socket(AF_INET6, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (fd)
    {
        int off = 0;
        if (::setsockopt(fd.get(), IPPROTO_IPV6, IPV6_V6ONLY, &off, sizeof(off)) == 0)
        {
            sockaddr_in6 any{};
            any.sin6_family = AF_INET6;
            any.sin6_addr = in6addr_any;
            if (::bind(fd.get(), reinterpret_cast<sockaddr *>(&any), sizeof(any)) == 0)
            {
                family = AF_INET6;
                return fd;
            }
        }
        fd.reset();
    }

    fd = SocketFd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!fd)
    {
        err = socket_error("socket", errno);
        return fd;
    }
    sockaddr_in any{};
    any.sin_family = AF_INET;
    any.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(fd.get(), reinterpret_cast<sockaddr *>(&any), sizeof(any)) != 0)
    {
        err = socket_error("bind", errno);
        fd.reset();
        return fd;
    }
    family = AF_INET;
    return fd;
}

// IPv4 group as seen from a socket of `family` (v4-mapped on a dual-stack socket).
bool make_ipv4_target(const LlmnrConfig &cfg,
                      int family,
                      sockaddr_storage &ss,
                      socklen_t &len)
{
    in_addr group{};
    if (inet_pton(AF_INET, cfg.ipv4_group.c_str(), &group) != 1) return false;
    ss = {};
    if (family == AF_INET)
    {
        auto *sin = reinterpret_cast<sockaddr_in *>(&ss);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(cfg.port);
        sin->sin_addr = group;
        len = sizeof(sockaddr_in);
        return true;
    }
    auto *sin6 = reinterpret_cast<sockaddr_in6 *>(&ss);
    sin6->sin6_family = AF_INET6;
    sin6->sin6_port = htons(cfg.port);
    sin6->sin6_addr.s6_addr[10] = 0xff;
    sin6->sin6_addr.s6_addr[11] = 0xff;
    std::memcpy(&sin6->sin6_addr.s6_addr[12], &group, sizeof(group));
    len = sizeof(sockaddr_in6);
    return true;
}

bool make_ipv6_target(const LlmnrConfig &cfg, sockaddr_storage &ss, socklen_t &len)
{
    ss = {};
    auto *sin6 = reinterpret_cast<sockaddr_in6 *>(&ss);
    if (inet_pton(AF_INET6, cfg.ipv6_group.c_str(), &sin6->sin6_addr) != 1) return false;
    sin6->sin6_family = AF_INET6;
    sin6->sin6_port = htons(cfg.port);
    sin6->sin6_scope_id = cfg.ipv6_scope_id;
    len = sizeof(sockaddr_in6);
    return true;
}

bool send_query(int fd, const QueryPacket &q, const sockaddr_storage &to, socklen_t len)
{
    const auto n = ::sendto(fd,
                            q.wire.data(),
                            q.wire.size(),
                            0,
                            reinterpret_cast<const sockaddr *>(&to),
                            len);
    return n == static_cast<ssize_t>(q.wire.size());
}
} // namespace

QueryPacket build_llmnr_query(const std::string &name)
{
    QueryPacket out{};
    std::string fqdn = name;
    if (fqdn.empty() || fqdn.back() != '.') fqdn += '.';

    auto invalid = [&](const char *why)
    {
        out.error.kind = ResolveErrorKind::InvalidName;
        out.error.cause = why;
        out.error.message = std::format("llmnr query {}: {}", name, why);
        return out;
    };

    if (name.empty() || fqdn == ".") return invalid("empty name");

    ldns_rdf *qname = ldns_dname_new_frm_str(fqdn.c_str());
    if (!qname) return invalid("not a valid domain name");

    // qname belongs to the packet once ldns_pkt_query_new succeeds
    PktPtr pkt(ldns_pkt_query_new(qname, LDNS_RR_TYPE_A, LDNS_RR_CLASS_IN, 0),
               &ldns_pkt_free);
    if (!pkt)
    {
        ldns_rdf_deep_free(qname);
        return invalid("cannot allocate query");
    }

    ldns_rr *aaaa = ldns_rr_new();
    if (!aaaa) return invalid("cannot allocate query");
    ldns_rr_set_owner(aaaa, ldns_rdf_clone(qname));
    ldns_rr_set_type(aaaa, LDNS_RR_TYPE_AAAA);
    ldns_rr_set_class(aaaa, LDNS_RR_CLASS_IN);
    ldns_rr_set_question(aaaa, true);
    if (!ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_QUESTION, aaaa))
    {
        ldns_rr_free(aaaa);
        return invalid("cannot allocate query");
    }

    // LLMNR is link-local only; recursion has no meaning.
    ldns_pkt_set_rd(pkt.get(), false);
    ldns_pkt_set_random_id(pkt.get());

    uint8_t *wire = nullptr;
    size_t size = 0;
    if (ldns_pkt2wire(&wire, pkt.get(), &size) != LDNS_STATUS_OK || !wire)
    {
        if (wire) LDNS_FREE(wire);
        return invalid("cannot encode query");
    }
    out.wire.assign(wire, wire + size);
    out.id = ldns_pkt_id(pkt.get());
    LDNS_FREE(wire);
    return out;
}

std::optional<std::vector<Address>> parse_llmnr_response(const uint8_t *data,
                                                         size_t size,
                                                         int expected_id)
{
    if (!data || size == 0) return std::nullopt;

    ldns_pkt *raw = nullptr;
    if (ldns_wire2pkt(&raw, data, size) != LDNS_STATUS_OK || !raw) return std::nullopt;
    PktPtr pkt(raw, &ldns_pkt_free);

    if (!ldns_pkt_qr(pkt.get())) return std::nullopt;
    if (expected_id >= 0 && ldns_pkt_id(pkt.get()) != expected_id) return std::nullopt;

    std::vector<Address> out;
    const ldns_rr_list *answers = ldns_pkt_answer(pkt.get());
    const size_t count = answers ? ldns_rr_list_rr_count(answers) : 0;
    for (size_t i = 0; i < count; ++i)
    {
        const ldns_rr *rr = ldns_rr_list_rr(answers, i);
        if (!rr || ldns_rr_rd_count(rr) < 1) continue;
        const ldns_rdf *rdf = ldns_rr_rdf(rr, 0);
        switch (ldns_rr_get_type(rr))
        {
            case LDNS_RR_TYPE_A:
                if (ldns_rdf_size(rdf) == 4)
                    out.push_back(address_from_bytes(AF_INET, ldns_rdf_data(rdf)));
                break;
            case LDNS_RR_TYPE_AAAA:
                if (ldns_rdf_size(rdf) == 16)
                    out.push_back(address_from_bytes(AF_INET6, ldns_rdf_data(rdf)));
                break;
            default:
                break;
        }
    }
    return out;
}

MulticastResolver::MulticastResolver(LlmnrConfig config)
    : config_(std::move(config))
{}

LookupResult MulticastResolver::lookup(const Budget &budget,
                                       const std::string &hostname,
                                       std::chrono::milliseconds timeout) const
{
    LookupResult result{};
    const auto t0 = Clock::now();
    if (timeout.count() <= 0) timeout = kMinMulticastTimeout;

    if (budget.cancelled())
    {
        result.error.kind = ResolveErrorKind::Cancelled;
        result.error.message = std::format("llmnr {}: operation cancelled", hostname);
        return result;
    }

    QueryPacket query = build_llmnr_query(hostname);
    if (query.error)
    {
        result.error = std::move(query.error);
        return result;
    }

    int family = AF_UNSPEC;
    ResolveError open_err{};
    SocketFd fd = open_query_socket(family, open_err);
    if (!fd)
    {
        result.ms = elapsed_ms(t0);
        result.error = std::move(open_err);
        return result;
    }

    const bool want_v4 = !config_.ipv4_group.empty();
    const bool want_v6 = !config_.ipv6_group.empty() && family == AF_INET6;
    if (!want_v4 && !want_v6)
    {
        result.ms = elapsed_ms(t0);
        result.error = socket_error("send", EDESTADDRREQ);
        return result;
    }

    sockaddr_storage to{};
    socklen_t to_len = 0;
    if (want_v4)
    {
        if (!make_ipv4_target(config_, family, to, to_len))
        {
            result.ms = elapsed_ms(t0);
            result.error = socket_error("ipv4 group " + config_.ipv4_group, EINVAL);
            return result;
        }
        if (!send_query(fd.get(), query, to, to_len))
        {
            result.ms = elapsed_ms(t0);
            result.error = socket_error("send", errno);
            return result;
        }
    }
    if (want_v6)
    {
        // Best effort: plenty of links carry IPv4 multicast only.
        // Without the IPv4 group a bad target or failed send is fatal.
        if (!make_ipv6_target(config_, to, to_len))
        {
            if (!want_v4)
            {
                result.ms = elapsed_ms(t0);
                result.error = socket_error("ipv6 group " + config_.ipv6_group, EINVAL);
                return result;
            }
        }
        else if (!send_query(fd.get(), query, to, to_len) && !want_v4)
        {
            result.ms = elapsed_ms(t0);
            result.error = socket_error("send", errno);
            return result;
        }
    }

    auto read_deadline = Clock::now() + timeout;
    if (budget.deadline > t0) read_deadline = std::min(read_deadline, budget.deadline);
    std::array<uint8_t, 4096> buf{};
    bool cancelled = false;
    for (;;)
    {
        if (budget.cancelled())
        {
            cancelled = true;
            break;
        }
        const auto now = Clock::now();
        if (now >= read_deadline) break;
        const auto slice = std::min(
            std::chrono::ceil<std::chrono::milliseconds>(read_deadline - now),
            kCancelPoll);

        pollfd pfd{fd.get(), POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(slice.count()));
        if (ready < 0)
        {
            if (errno == EINTR) continue;
            result.error = socket_error("poll", errno);
            break;
        }
        if (ready == 0) continue;

        const auto n = ::recvfrom(fd.get(), buf.data(), buf.size(), 0, nullptr, nullptr);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            result.error = socket_error("read", errno);
            break;
        }

        // unrelated or malformed traffic is skipped
        auto answers = parse_llmnr_response(buf.data(), static_cast<size_t>(n), query.id);
        if (!answers) continue;
        for (auto &a : *answers) result.addresses.push_back(std::move(a));
    }
    result.ms = elapsed_ms(t0);

    if (result.error)
    {
        result.addresses.clear();
        return result;
    }

    result.addresses = dedupe_addresses(std::move(result.addresses));
    if (result.addresses.empty())
    {
        if (cancelled)
        {
            result.error.kind = ResolveErrorKind::Cancelled;
            result.error.message = std::format("llmnr {}: operation cancelled", hostname);
        }
        else
        {
            result.error.kind = ResolveErrorKind::NoResponses;
            result.error.message = std::format("llmnr {}: no responses", hostname);
        }
    }
    return result;
}
} // namespace sr
