#include "sr/output.hpp"

#include <sys/socket.h>
#include <sstream>
#include <iomanip>

#include "sr/model.hpp"
#include "sr/options.hpp"
#include "sr/remote_path.hpp"
#include "sr/runner.hpp"

namespace sr {

const char *family_str(const int af)
{
    switch (af)
    {
        case AF_INET: return "inet";
        case AF_INET6: return "inet6";
        default: return "unspec";
    }
}

std::string format_header_text(const Options& opt)
{
    std::ostringstream os;
    os << "Resolving: " << opt.servers.size() << " server(s)"
       << "  Timeout: " << opt.timeout_ms << " ms"
       << "  Concurrency: " << opt.concurrency << '\n';
    os << "LLMNR: " << (opt.multicast ? "on" : "off");
    if (opt.multicast)
    {
        os << "  v4=" << (opt.llmnr.ipv4_group.empty() ? "(off)" : opt.llmnr.ipv4_group.c_str())
           << " v6=" << (opt.llmnr.ipv6_group.empty() ? "(off)" : opt.llmnr.ipv6_group.c_str());
        if (!opt.llmnr_if.empty()) os << '%' << opt.llmnr_if;
        os << " port=" << opt.llmnr.port;
    }
    os << "  Connect: " << (opt.connect ? "on" : "off") << '\n';
    return os.str();
}

std::string format_addresses_text(const std::vector<Address>& addresses)
{
    std::ostringstream os;
    for (const auto& a : addresses)
    {
        os << "  - [" << family_str(a.af) << "] " << a.ip << '\n';
    }
    return os.str();
}

std::string format_attempts_text(const std::vector<TierAttempt>& attempts)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    for (const auto& at : attempts)
    {
        os << "  tier " << at.strategy << " (" << at.hostname << "): ";
        if (at.skipped)
        {
            os << "skipped <" << at.error.message << ">\n";
        }
        else if (!at.addresses.empty())
        {
            os << at.ms << " ms - " << at.addresses.size() << " address(es)\n";
        }
        else
        {
            os << at.ms << " ms - <" << at.error.message << ">\n";
        }
    }
    return os.str();
}

std::string format_error_text(const ResolveError& error)
{
    if (!error) return {};
    return "error: " + error.message + '\n';
}

std::string format_report_text(const ServerReport& report, bool verbose)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "server: " << report.input << '\n';
    if (report.parse_error)
    {
        os << "  " << format_error_text(report.parse_error);
        return os.str();
    }
    os << "  host: " << report.spec.host << "  port: " << report.spec.port << '\n';
    if (verbose) os << format_attempts_text(report.resolved.attempts);
    if (report.resolved.error)
    {
        os << "  " << format_error_text(report.resolved.error);
        return os.str();
    }
    os << "  resolved in " << report.resolved.ms << " ms - "
       << report.resolved.addresses.size() << " address(es)\n";
    os << format_addresses_text(report.resolved.addresses);
    if (report.dialed)
    {
        if (report.dial.error)
        {
            os << "  " << format_error_text(report.dial.error);
        }
        else
        {
            os << "  connected: " << report.dial.address.ip << " port " << report.spec.port
               << " (" << report.dial.tried << " tried, " << report.dial.ms << " ms)\n";
        }
    }
    return os.str();
}

std::string format_paths_text(const std::vector<std::string>& paths)
{
    std::ostringstream os;
    for (const auto& p : paths)
    {
        os << "path: " << (p.empty() ? "\"\"" : p) << " -> " << normalize_remote_path(p) << '\n';
    }
    return os.str();
}

} // namespace sr
