// SMB server address resolver (C++23)
// Resolves server arguments through DNS, "<name>.local" and LLMNR, and
// optionally checks that the SMB port answers on the resolved addresses.

#include <print>
#include <vector>

#include "sr/cli.hpp"
#include "sr/engine.hpp"
#include "sr/options.hpp"
#include "sr/output.hpp"
#include "sr/runner.hpp"

int main(int argc, char **argv)
{
    sr::Options opt;
    if (argc <= 1)
    {
        sr::print_usage(argv[0]);
        return 2;
    }
    switch (sr::parse_args(argc, argv, opt))
    {
        case sr::ParseStatus::Help: return 0;
        case sr::ParseStatus::Error:
            sr::print_usage(argv[0]);
            return 2;
        case sr::ParseStatus::Ok: break;
    }

    sr::HostResolver resolver(opt.llmnr);
    resolver.set_multicast_enabled(opt.multicast);

    if (!opt.json)
    {
        if (!opt.servers.empty()) std::print("{}", sr::format_header_text(opt));
        std::print("{}", sr::format_paths_text(opt.paths));
    }

    // Text mode streams each report as it completes (callbacks are
    // serialized by the runner); JSON waits for all.
    auto on_report = [&](int, const sr::ServerReport &report)
    {
        if (opt.json) return;
        std::print("{}", sr::format_report_text(report, opt.verbose));
    };
    const std::vector<sr::ServerReport> reports = sr::run_servers(resolver, opt, on_report);

    if (opt.json) std::println("{}", sr::build_final_json(opt, reports));

    for (const auto &r : reports)
    {
        if (!r.ok()) return 1;
    }
    return 0;
}
