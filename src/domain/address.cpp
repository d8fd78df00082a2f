#include "sr/address.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <charconv>
#include <format>

namespace sr
{
std::optional<Address> parse_ip_literal(std::string_view text)
{
    if (text.empty() || text.size() >= INET6_ADDRSTRLEN) return std::nullopt;
    const std::string s(text);

    in_addr v4{};
    if (inet_pton(AF_INET, s.c_str(), &v4) == 1)
    {
        return address_from_bytes(AF_INET, &v4);
    }
    in6_addr v6{};
    if (inet_pton(AF_INET6, s.c_str(), &v6) == 1)
    {
        return address_from_bytes(AF_INET6, &v6);
    }
    return std::nullopt;
}

Address address_from_bytes(const int af, const void *bytes)
{
    Address out{};
    char buf[INET6_ADDRSTRLEN]{};
    if (af != AF_INET && af != AF_INET6) return out;
    if (inet_ntop(af, bytes, buf, sizeof(buf)))
    {
        out.af = af;
        out.ip = buf;
    }
    return out;
}

namespace
{
struct SplitResult
{
    std::string_view host;
    std::string_view port;
    const char *cause = nullptr;   // nullptr on success
    bool missing_port = false;
};

// host:port splitting with bracketed IPv6 hosts, mirroring the usual
// resolver conventions ("[::1]:445", "server:445").
SplitResult split_host_port(std::string_view hp)
{
    SplitResult r{};
    const auto i = hp.rfind(':');
    if (i == std::string_view::npos)
    {
        r.cause = "missing port in address";
        r.missing_port = true;
        return r;
    }

    size_t j = 0;
    size_t k = 0;
    if (hp.front() == '[')
    {
        const auto end = hp.find(']');
        if (end == std::string_view::npos)
        {
            r.cause = "missing ']' in address";
            return r;
        }
        if (end + 1 == hp.size())
        {
            r.cause = "missing port in address";
            r.missing_port = true;
            return r;
        }
        if (end + 1 != i)
        {
            if (hp[end + 1] == ':')
            {
                r.cause = "too many colons in address";
            }
            else
            {
                r.cause = "missing port in address";
                r.missing_port = true;
            }
            return r;
        }
        r.host = hp.substr(1, end - 1);
        j = 1;
        k = end + 1;
    }
    else
    {
        r.host = hp.substr(0, i);
        if (r.host.find(':') != std::string_view::npos)
        {
            r.cause = "too many colons in address";
            return r;
        }
    }
    if (hp.substr(j).find('[') != std::string_view::npos)
    {
        r.cause = "unexpected '[' in address";
        return r;
    }
    if (hp.substr(k).find(']') != std::string_view::npos)
    {
        r.cause = "unexpected ']' in address";
        return r;
    }
    r.port = hp.substr(i + 1);
    return r;
}

bool valid_port(std::string_view port)
{
    if (port.empty() || port.size() > 5) return false;
    unsigned value = 0;
    const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    return ec == std::errc{} && ptr == port.data() + port.size() && value <= 65535;
}

ParseResult parse_failure(std::string_view address, std::string cause)
{
    ParseResult out{};
    out.error.kind = ResolveErrorKind::AddressParse;
    out.error.message = std::format("parse server address \"{}\": {}", address, cause);
    out.error.cause = std::move(cause);
    return out;
}

ParseResult parse_success(std::string_view host, std::string_view port)
{
    ParseResult out{};
    out.spec.host = std::string(host);
    out.spec.port = std::string(port);
    return out;
}
} // namespace

ParseResult parse_server_address(std::string_view address)
{
    if (address.empty())
    {
        ParseResult out{};
        out.error.kind = ResolveErrorKind::EmptyAddress;
        out.error.message = "server address is required";
        return out;
    }

    // "[v6]" alone: the colons belong to the literal, not to a port
    if (address.size() >= 2 && address.front() == '[' && address.back() == ']')
    {
        const auto inner = address.substr(1, address.size() - 2);
        if (inner.empty()) return parse_failure(address, "missing host in address");
        return parse_success(inner, kDefaultSmbPort);
    }

    const SplitResult split = split_host_port(address);
    if (!split.cause)
    {
        if (split.host.empty()) return parse_failure(address, "missing host in address");
        if (split.port.empty()) return parse_success(split.host, kDefaultSmbPort);
        if (!valid_port(split.port))
        {
            return parse_failure(address, std::format("invalid port \"{}\"", split.port));
        }
        return parse_success(split.host, split.port);
    }

    if (split.missing_port)
    {
        if (address.front() != '[') return parse_success(address, kDefaultSmbPort);
        // "[fe80::1]x": brackets are trimmed from both ends, the rest kept
        const auto first = address.find_first_not_of("[]");
        if (first == std::string_view::npos)
        {
            return parse_failure(address, "missing host in address");
        }
        const auto last = address.find_last_not_of("[]");
        return parse_success(address.substr(first, last - first + 1), kDefaultSmbPort);
    }

    // bare IPv6 literal such as fe80::1
    if (parse_ip_literal(address)) return parse_success(address, kDefaultSmbPort);

    return parse_failure(address, split.cause);
}

std::string join_host_port(const std::string &host, const std::string &port)
{
    if (host.find(':') != std::string::npos) return "[" + host + "]:" + port;
    return host + ":" + port;
}
} // namespace sr
