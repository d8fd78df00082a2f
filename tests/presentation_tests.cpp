#include <string>
#include <string_view>
#include <vector>
#include <iostream>
#include <sys/socket.h>

#include "sr/json.hpp"
#include "sr/output.hpp"
#include "sr/options.hpp"
#include "sr/model.hpp"
#include "sr/runner.hpp"

using namespace sr;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) == std::string::npos)
    {
        std::cerr << "ASSERT FAILED: missing substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static void assert_not_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) != std::string::npos)
    {
        std::cerr << "ASSERT FAILED: unexpected substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static ServerReport resolved_report()
{
    ServerReport rep{};
    rep.input = "fileserver:1445";
    rep.spec = {"fileserver", "1445"};
    rep.resolved.host = "fileserver";
    rep.resolved.ms = 12.5;
    rep.resolved.addresses = {{AF_INET, "192.168.1.10"}, {AF_INET6, "fe80::10"}};

    TierAttempt miss{};
    miss.strategy = "unicast";
    miss.hostname = "fileserver";
    miss.ms = 4.25;
    miss.error.kind = ResolveErrorKind::LookupFailed;
    miss.error.message = "lookup fileserver: Name or service not known";
    miss.error.rc = -2;

    TierAttempt hit{};
    hit.strategy = "unicast-local";
    hit.hostname = "fileserver.local";
    hit.ms = 8.0;
    hit.addresses = rep.resolved.addresses;

    rep.resolved.attempts = {miss, hit};
    return rep;
}

static void test_format_header_text()
{
    Options opt{};
    opt.servers = {"a", "b"};
    opt.timeout_ms = 2500;
    opt.concurrency = 2;
    opt.llmnr_if = "eth0";
    opt.connect = true;

    std::string s = format_header_text(opt);
    assert_contains(s, "Resolving: 2 server(s)  Timeout: 2500 ms  Concurrency: 2\n", "header: title");
    assert_contains(s, "LLMNR: on  v4=224.0.0.252 v6=ff02::1:3%eth0 port=5355  Connect: on\n", "header: llmnr");

    opt.multicast = false;
    opt.connect = false;
    s = format_header_text(opt);
    assert_contains(s, "LLMNR: off  Connect: off\n", "header: llmnr off");
}

static void test_format_report_text()
{
    ServerReport rep = resolved_report();
    std::string s = format_report_text(rep, false);
    assert_contains(s, "server: fileserver:1445\n", "server line");
    assert_contains(s, "  host: fileserver  port: 1445\n", "host line");
    assert_contains(s, "  resolved in 12.500 ms - 2 address(es)\n", "summary line");
    assert_contains(s, "  - [inet] 192.168.1.10\n", "v4 address");
    assert_contains(s, "  - [inet6] fe80::10\n", "v6 address");
    assert_not_contains(s, "tier ", "attempts hidden unless verbose");

    std::string v = format_report_text(rep, true);
    assert_contains(v, "  tier unicast (fileserver): 4.250 ms - <lookup fileserver: Name or service not known>\n",
                    "failed tier");
    assert_contains(v, "  tier unicast-local (fileserver.local): 8.000 ms - 2 address(es)\n", "winning tier");
}

static void test_format_report_text_dial_and_errors()
{
    ServerReport rep = resolved_report();
    rep.dialed = true;
    rep.dial.tried = 2;
    rep.dial.ms = 1.5;
    rep.dial.address = {AF_INET6, "fe80::10"};
    assert_contains(format_report_text(rep, false), "  connected: fe80::10 port 1445 (2 tried, 1.500 ms)\n",
                    "connect line");

    rep.dial.error.kind = ResolveErrorKind::Connect;
    rep.dial.error.message = "dial [fe80::10]:1445: Connection refused";
    assert_contains(format_report_text(rep, false), "  error: dial [fe80::10]:1445: Connection refused\n",
                    "dial error line");

    ServerReport bad{};
    bad.input = "a:b:c";
    bad.parse_error.kind = ResolveErrorKind::AddressParse;
    bad.parse_error.message = "parse server address \"a:b:c\": too many colons in address";
    std::string s = format_report_text(bad, true);
    assert_contains(s, "  error: parse server address \"a:b:c\": too many colons in address\n", "parse error");
    assert_not_contains(s, "host:", "no host line after parse error");

    ServerReport skipped{};
    skipped.input = "slow";
    skipped.spec = {"slow", "445"};
    TierAttempt at{};
    at.strategy = "multicast";
    at.hostname = "slow";
    at.skipped = true;
    at.error.kind = ResolveErrorKind::Cancelled;
    at.error.message = "multicast slow: deadline exceeded";
    skipped.resolved.attempts = {at};
    skipped.resolved.error.kind = ResolveErrorKind::Aggregate;
    skipped.resolved.error.message = "resolve slow: multicast slow: deadline exceeded";
    s = format_report_text(skipped, true);
    assert_contains(s, "  tier multicast (slow): skipped <multicast slow: deadline exceeded>\n", "skipped tier");
    assert_contains(s, "  error: resolve slow: multicast slow: deadline exceeded\n", "aggregate error");
    assert_not_contains(s, "resolved in", "no summary on failure");
}

static void test_format_paths_text()
{
    std::string s = format_paths_text({"\\\\server\\share", "", "/a/../b"});
    assert_true(s == "path: \\\\server\\share -> server/share\n"
                     "path: \"\" -> .\n"
                     "path: /a/../b -> b\n",
                "paths exact");
    assert_true(format_paths_text({}).empty(), "no paths, no output");
}

static void test_json_escape()
{
    assert_true(json_escape("plain") == "plain", "plain");
    assert_true(json_escape("a\"b\\c") == "a\\\"b\\\\c", "quote and backslash");
    assert_true(json_escape("x\ny\tz") == "x\\ny\\tz", "newline and tab");
    assert_true(json_escape(std::string_view("\x01", 1)) == "\\u0001", "control char");
    assert_true(json_string("a\\b") == "\"a\\\\b\"", "quoted string");
}

static void test_build_report_json()
{
    ServerReport rep = resolved_report();
    rep.dialed = true;
    rep.dial.tried = 1;
    rep.dial.ms = 2.0;
    rep.dial.address = {AF_INET, "192.168.1.10"};

    std::string js = build_report_json(rep);
    assert_contains(js, R"("server":"fileserver:1445","ok":true,"host":"fileserver","port":"1445")", "head");
    assert_contains(js, R"("ms":12.500)", "ms");
    assert_contains(js, R"("addresses":[{"family":"inet","ip":"192.168.1.10"},{"family":"inet6","ip":"fe80::10"}])",
                    "addresses");
    assert_contains(js, R"({"tier":"unicast","hostname":"fileserver","ms":4.250,"skipped":false,"count":0,"error":{"kind":"lookup_failed")",
                    "failed attempt");
    assert_contains(js, R"("rc":-2)", "rc kept");
    assert_contains(js, R"({"tier":"unicast-local","hostname":"fileserver.local","ms":8.000,"skipped":false,"count":2})",
                    "winning attempt");
    assert_contains(js, R"("connect":{"tried":1,"ms":2.000,"address":"192.168.1.10"})", "connect");
    assert_true(js.front() == '{' && js.back() == '}', "single object");
}

static void test_build_report_json_errors()
{
    ServerReport bad{};
    bad.input = "host:\"x";
    bad.parse_error.kind = ResolveErrorKind::AddressParse;
    bad.parse_error.message = "parse server address \"host:\\\"x\": invalid port";
    bad.parse_error.cause = "invalid port";
    std::string js = build_report_json(bad);
    assert_contains(js, R"("server":"host:\"x","ok":false,"error":{"kind":"address_parse")", "parse error");
    assert_contains(js, R"("cause":"invalid port")", "cause");
    assert_not_contains(js, R"("host":)", "no host after parse error");

    ServerReport failed{};
    failed.input = "ghost";
    failed.spec = {"ghost", "445"};
    failed.resolved.error.kind = ResolveErrorKind::Aggregate;
    failed.resolved.error.message = "resolve ghost: llmnr ghost.local: no responses";
    failed.resolved.error.cause = "llmnr ghost.local: no responses";
    failed.resolved.error.cause_kind = ResolveErrorKind::NoResponses;
    js = build_report_json(failed);
    assert_contains(js, R"("ok":false)", "not ok");
    assert_contains(js, R"("error":{"kind":"aggregate","message":"resolve ghost: llmnr ghost.local: no responses")",
                    "aggregate");
    assert_contains(js, R"("cause_kind":"no_responses")", "cause kind");
}

static void test_build_final_json()
{
    Options opt{};
    opt.servers = {"fileserver:1445"};
    opt.paths = {"\\\\server\\share"};
    opt.timeout_ms = 2000;

    std::string js = build_final_json(opt, {resolved_report()});
    assert_contains(js, R"({"timeout_ms":2000,)", "timeout");
    assert_contains(js, R"("llmnr":{"enabled":true,"ipv4_group":"224.0.0.252","ipv6_group":"ff02::1:3","port":5355})",
                    "llmnr block");
    assert_contains(js, R"("connect":false,"concurrency":1,"servers":[{"server":"fileserver:1445")", "servers");
    assert_contains(js, R"("paths":[{"input":"\\\\server\\share","normalized":"server/share"}])", "paths");

    opt.paths.clear();
    assert_not_contains(build_final_json(opt, {}), "paths", "paths omitted when none given");
}

int main()
{
    test_format_header_text();
    test_format_report_text();
    test_format_report_text_dial_and_errors();
    test_format_paths_text();
    test_json_escape();
    test_build_report_json();
    test_build_report_json_errors();
    test_build_final_json();
    std::cout << "presentation tests: OK" << std::endl;
    return 0;
}
