#include "sr/runner.hpp"

#include <chrono>
#include <mutex>

#include "sr/address.hpp"
#include "sr/dialer.hpp"
#include "infra/socket_fd.hpp"

namespace sr
{
ServerReport resolve_server(const HostResolver &resolver,
                            const std::string &input,
                            const Options &opt,
                            const std::atomic<bool> *cancel)
{
    ServerReport report{};
    report.input = input;

    ParseResult parsed = parse_server_address(input);
    if (parsed.error)
    {
        report.parse_error = std::move(parsed.error);
        return report;
    }
    report.spec = std::move(parsed.spec);

    std::chrono::milliseconds timeout{opt.timeout_ms};
    report.resolved = resolver.resolve(report.spec.host, timeout, cancel);
    if (report.resolved.error || !opt.connect) return report;

    // Dialing gets its own budget: a multicast tier may legitimately have
    // spent the whole resolution budget.
    if (timeout.count() <= 0) timeout = kDefaultResolveTimeout;
    report.dialed = true;
    report.dial = dial_first(Budget::after(timeout, cancel),
                             report.resolved.addresses,
                             report.spec.port);
    // Only reachability is reported; the session itself belongs to the SMB layer.
    SocketFd connected(report.dial.fd);
    report.dial.fd = -1;
    return report;
}

std::vector<ServerReport> run_servers(const HostResolver &resolver,
                                      const Options &opt,
                                      const ReportCallback &on_report,
                                      Cancellation *cancel)
{
    std::vector<ServerReport> reports(opt.servers.size());
    std::mutex report_mtx;

    auto do_one = [&](int idx, const std::atomic<bool> &flag)
    {
        ServerReport report = resolve_server(resolver, opt.servers[idx - 1], opt, &flag);
        std::scoped_lock lk(report_mtx);
        reports[idx - 1] = std::move(report);
        if (on_report) on_report(idx, reports[idx - 1]);
    };

    for_each_index_concurrent(static_cast<int>(opt.servers.size()),
                              opt.concurrency,
                              do_one,
                              cancel);
    return reports;
}
} // namespace sr
