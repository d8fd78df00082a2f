#include "sr/cli.hpp"

#include <charconv>
#include <print>
#include <string>
#include <string_view>

#include <net/if.h>

using namespace std::string_view_literals;

namespace sr {

void print_usage(const char *prog)
{
    std::println("SMB server address resolver (DNS, .local, LLMNR)");
    std::println("Usage: {} [options] <server[:port]> [<server[:port]> ...]", prog);
    std::println("Options:");
    std::println(
        "  --timeout MS       Resolution budget per server (default: 10000)");
    std::println(
        "  --connect          Dial the SMB port on each address until one connects");
    std::println(
        "  --path P           Print the normalized remote path (repeatable)");
    std::println("  --no-llmnr         Disable the LLMNR multicast tiers");
    std::println(
        "  --llmnr-v4 ADDR    IPv4 LLMNR group (default: 224.0.0.252, empty disables)");
    std::println(
        "  --llmnr-v6 ADDR    IPv6 LLMNR group (default: ff02::1:3, empty disables)");
    std::println("  --llmnr-port N     LLMNR port (default: 5355)");
    std::println(
        "  --llmnr-if NAME    Interface for the IPv6 link-local group");
    std::println(
        "  --concurrency K    Number of servers resolved in parallel (default: 1)");
    std::println("  --parallel K       Alias of --concurrency");
    std::println("  --json             Output results in JSON format");
    std::println("  -v, --verbose      Show every resolution tier");
    std::println("  -h, --help         Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} fileserver", prog);
    std::println("  {} --connect --timeout 3000 nas.local:1445 [fe80::1]", prog);
    std::println("  {} --path '\\\\folder\\\\nested\\\\'", prog);
}

namespace {

// "--name VALUE" or "--name=VALUE"; false when `a` is not this option.
// `ok` turns false when the option is present but its value is missing.
bool take_value(std::string_view a,
                std::string_view name,
                int argc,
                char **argv,
                int &i,
                std::string &val,
                bool &ok)
{
    if (a.rfind(name, 0) != 0) return false;
    if (a.size() == name.size())
    {
        if (i + 1 >= argc)
        {
            std::println("missing value for {}", name);
            ok = false;
            return true;
        }
        val = argv[++i];
        return true;
    }
    if (a[name.size()] != '=') return false;
    val = std::string(a.substr(name.size() + 1));
    return true;
}

bool parse_int(const std::string &val, int &out)
{
    const auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
    return !val.empty() && ec == std::errc{} && ptr == val.data() + val.size();
}

} // namespace

ParseStatus parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        bool ok = true;
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return ParseStatus::Help;
        }
        if (a == "--connect"sv)
        {
            opt.connect = true;
        }
        else if (a == "--no-llmnr"sv)
        {
            opt.multicast = false;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbose = true;
        }
        else if (take_value(a, "--timeout", argc, argv, i, val, ok))
        {
            if (!ok) return ParseStatus::Error;
            if (!parse_int(val, opt.timeout_ms))
            {
                std::println("invalid --timeout value: {}", val);
                return ParseStatus::Error;
            }
            if (opt.timeout_ms < 0) opt.timeout_ms = 0;
        }
        else if (take_value(a, "--path", argc, argv, i, val, ok))
        {
            if (!ok) return ParseStatus::Error;
            opt.paths.push_back(std::move(val));
        }
        else if (take_value(a, "--llmnr-v4", argc, argv, i, val, ok))
        {
            if (!ok) return ParseStatus::Error;
            opt.llmnr.ipv4_group = std::move(val);
        }
        else if (take_value(a, "--llmnr-v6", argc, argv, i, val, ok))
        {
            if (!ok) return ParseStatus::Error;
            opt.llmnr.ipv6_group = std::move(val);
        }
        else if (take_value(a, "--llmnr-port", argc, argv, i, val, ok))
        {
            if (!ok) return ParseStatus::Error;
            int port = 0;
            if (!parse_int(val, port) || port <= 0 || port > 65535)
            {
                std::println("invalid --llmnr-port value: {}", val);
                return ParseStatus::Error;
            }
            opt.llmnr.port = static_cast<uint16_t>(port);
        }
        else if (take_value(a, "--llmnr-if", argc, argv, i, val, ok))
        {
            if (!ok) return ParseStatus::Error;
            const unsigned index = if_nametoindex(val.c_str());
            if (index == 0)
            {
                std::println("unknown interface: {}", val);
                return ParseStatus::Error;
            }
            opt.llmnr_if = std::move(val);
            opt.llmnr.ipv6_scope_id = index;
        }
        else if (take_value(a, "--concurrency", argc, argv, i, val, ok) ||
                 take_value(a, "--parallel", argc, argv, i, val, ok))
        {
            if (!ok) return ParseStatus::Error;
            if (!parse_int(val, opt.concurrency))
            {
                std::println("invalid concurrency: {}", val);
                return ParseStatus::Error;
            }
            if (opt.concurrency <= 0) opt.concurrency = 1;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println("unknown option: {}", a);
            return ParseStatus::Error;
        }
        else
        {
            opt.servers.emplace_back(a);
        }
    }
    if (opt.servers.empty() && opt.paths.empty())
    {
        std::println("no server given");
        return ParseStatus::Error;
    }
    return ParseStatus::Ok;
}

} // namespace sr
