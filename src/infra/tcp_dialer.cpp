#include "sr/dialer.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include "sr/address.hpp"
#include "infra/socket_fd.hpp"

namespace sr
{
namespace
{
constexpr std::chrono::milliseconds kCancelPoll{100};

bool make_target(const Address &a, uint16_t port, sockaddr_storage &ss, socklen_t &len)
{
    ss = {};
    if (a.af == AF_INET)
    {
        auto *sin = reinterpret_cast<sockaddr_in *>(&ss);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        len = sizeof(sockaddr_in);
        return inet_pton(AF_INET, a.ip.c_str(), &sin->sin_addr) == 1;
    }
    if (a.af == AF_INET6)
    {
        auto *sin6 = reinterpret_cast<sockaddr_in6 *>(&ss);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        len = sizeof(sockaddr_in6);
        return inet_pton(AF_INET6, a.ip.c_str(), &sin6->sin6_addr) == 1;
    }
    return false;
}

// 0 on success, errno otherwise. ETIMEDOUT when the budget ran out,
// ECANCELED when the cancel flag was raised.
int connect_one(const Budget &budget, const Address &a, uint16_t port, SocketFd &out)
{
    sockaddr_storage ss{};
    socklen_t len = 0;
    if (!make_target(a, port, ss, len)) return EINVAL;

    SocketFd fd(::socket(a.af, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd) return errno;

    if (::connect(fd.get(), reinterpret_cast<sockaddr *>(&ss), len) != 0)
    {
        if (errno != EINPROGRESS) return errno;
        for (;;)
        {
            if (budget.cancelled()) return ECANCELED;
            const auto left = budget.remaining();
            if (left.count() <= 0) return ETIMEDOUT;
            pollfd pfd{fd.get(), POLLOUT, 0};
            const int ready = ::poll(&pfd, 1, static_cast<int>(std::min(left, kCancelPoll).count()));
            if (ready < 0)
            {
                if (errno == EINTR) continue;
                return errno;
            }
            if (ready > 0) break;
        }
        int soerr = 0;
        socklen_t soerr_len = sizeof(soerr);
        if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &soerr, &soerr_len) != 0) return errno;
        if (soerr != 0) return soerr;
    }

    // hand over a blocking socket
    const int flags = ::fcntl(fd.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd.get(), F_SETFL, flags & ~O_NONBLOCK) != 0) return errno;
    out = std::move(fd);
    return 0;
}

double elapsed_ms(const Clock::time_point t0)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}
} // namespace

DialResult dial_first(const Budget &budget,
                      const std::vector<Address> &addresses,
                      const std::string &port)
{
    DialResult result{};
    const auto t0 = Clock::now();

    unsigned port_value = 0;
    const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), port_value);
    if (ec != std::errc{} || ptr != port.data() + port.size() || port_value > 65535)
    {
        result.error.kind = ResolveErrorKind::AddressParse;
        result.error.message = std::format("dial: invalid port \"{}\"", port);
        return result;
    }

    int last_err = 0;
    const Address *last = nullptr;
    for (const auto &a : addresses)
    {
        if (!a.valid()) continue;
        if (budget.expired())
        {
            last_err = budget.cancelled() ? ECANCELED : ETIMEDOUT;
            break;
        }
        ++result.tried;
        last = &a;
        SocketFd fd;
        last_err = connect_one(budget, a, static_cast<uint16_t>(port_value), fd);
        if (last_err == 0)
        {
            result.fd = fd.release();
            result.address = a;
            result.ms = elapsed_ms(t0);
            return result;
        }
    }

    result.ms = elapsed_ms(t0);
    result.error.kind = last_err == ECANCELED ? ResolveErrorKind::Cancelled : ResolveErrorKind::Connect;
    result.error.rc = last_err;
    if (!last)
    {
        result.error.cause = last_err ? std::strerror(last_err) : "no addresses to dial";
        result.error.message = std::format("dial port {}: {}", port, result.error.cause);
        return result;
    }
    result.error.cause = std::strerror(last_err);
    result.error.message = std::format("dial {}: {}",
                                       join_host_port(last->ip, port),
                                       result.error.cause);
    return result;
}
} // namespace sr
