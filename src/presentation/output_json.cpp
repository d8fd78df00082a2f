#include "sr/output.hpp"

#include <sstream>
#include <iomanip>

#include "sr/json.hpp"
#include "sr/model.hpp"
#include "sr/options.hpp"
#include "sr/remote_path.hpp"
#include "sr/runner.hpp"

namespace sr
{
namespace
{
void write_error(std::ostringstream &os, const ResolveError &e)
{
    os << R"({"kind":)" << json_string(error_kind_str(e.kind))
            << R"(,"message":)" << json_string(e.message);
    if (!e.cause.empty()) os << R"(,"cause":)" << json_string(e.cause);
    if (e.cause_kind != ResolveErrorKind::None)
        os << R"(,"cause_kind":)" << json_string(error_kind_str(e.cause_kind));
    if (e.rc != 0) os << R"(,"rc":)" << e.rc;
    os << "}";
}

void write_addresses(std::ostringstream &os, const std::vector<Address> &addresses)
{
    os << "[";
    for (size_t i = 0; i < addresses.size(); ++i)
    {
        if (i) os << ",";
        os << R"({"family":)" << json_string(family_str(addresses[i].af))
                << R"(,"ip":)" << json_string(addresses[i].ip) << "}";
    }
    os << "]";
}
} // namespace

std::string build_report_json(const ServerReport &report)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("server":)" << json_string(report.input);
    os << R"(,"ok":)" << (report.ok() ? "true" : "false");
    if (report.parse_error)
    {
        os << R"(,"error":)";
        write_error(os, report.parse_error);
        os << "}";
        return os.str();
    }
    os << R"(,"host":)" << json_string(report.spec.host)
            << R"(,"port":)" << json_string(report.spec.port);

    const ResolveResult &r = report.resolved;
    os << R"(,"ms":)" << r.ms;
    os << R"(,"addresses":)";
    write_addresses(os, r.addresses);
    os << R"(,"attempts":[)";
    for (size_t i = 0; i < r.attempts.size(); ++i)
    {
        const auto &at = r.attempts[i];
        if (i) os << ",";
        os << R"({"tier":)" << json_string(at.strategy)
                << R"(,"hostname":)" << json_string(at.hostname)
                << R"(,"ms":)" << at.ms
                << R"(,"skipped":)" << (at.skipped ? "true" : "false")
                << R"(,"count":)" << at.addresses.size();
        if (at.error)
        {
            os << R"(,"error":)";
            write_error(os, at.error);
        }
        os << "}";
    }
    os << "]";
    if (r.error)
    {
        os << R"(,"error":)";
        write_error(os, r.error);
    }
    if (report.dialed)
    {
        os << R"(,"connect":{"tried":)" << report.dial.tried
                << R"(,"ms":)" << report.dial.ms;
        if (report.dial.error)
        {
            os << R"(,"error":)";
            write_error(os, report.dial.error);
        }
        else
        {
            os << R"(,"address":)" << json_string(report.dial.address.ip);
        }
        os << "}";
    }
    os << "}";
    return os.str();
}

std::string build_final_json(const Options &opt,
                             const std::vector<ServerReport> &reports)
{
    std::ostringstream os;
    os << "{";
    os << R"("timeout_ms":)" << opt.timeout_ms << ",";
    os << R"("llmnr":{"enabled":)" << (opt.multicast ? "true" : "false")
            << R"(,"ipv4_group":)" << json_string(opt.llmnr.ipv4_group)
            << R"(,"ipv6_group":)" << json_string(opt.llmnr.ipv6_group)
            << R"(,"port":)" << opt.llmnr.port << "},";
    os << R"("connect":)" << (opt.connect ? "true" : "false") << ",";
    os << R"("concurrency":)" << opt.concurrency << ",";
    os << R"("servers":[)";
    for (size_t i = 0; i < reports.size(); ++i)
    {
        if (i) os << ",";
        os << build_report_json(reports[i]);
    }
    os << "]";
    if (!opt.paths.empty())
    {
        os << R"(,"paths":[)";
        for (size_t i = 0; i < opt.paths.size(); ++i)
        {
            if (i) os << ",";
            os << R"({"input":)" << json_string(opt.paths[i])
                    << R"(,"normalized":)" << json_string(normalize_remote_path(opt.paths[i]))
                    << "}";
        }
        os << "]";
    }
    os << "}";
    return os.str();
}
} // namespace sr
