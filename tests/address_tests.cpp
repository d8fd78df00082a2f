#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <sys/socket.h>

#include "sr/address.hpp"

using namespace sr;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq(const std::string &actual, const std::string &expected, std::string_view msg)
{
    if (actual != expected)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << expected
                  << " actual=" << actual << std::endl;
        std::exit(1);
    }
}

static void expect_host_port(std::string_view input, const char *host, const char *port)
{
    ParseResult r = parse_server_address(input);
    const std::string label = "parse " + std::string(input);
    assert_true(!r.error, label + ": unexpected error " + r.error.message);
    assert_eq(r.spec.host, host, label + ": host");
    assert_eq(r.spec.port, port, label + ": port");
}

static void expect_parse_error(std::string_view input)
{
    ParseResult r = parse_server_address(input);
    const std::string label = "parse " + std::string(input);
    assert_true(r.error.kind == ResolveErrorKind::AddressParse, label + ": AddressParse expected");
    assert_true(r.error.message.find(std::string(input)) != std::string::npos,
                label + ": message names the input");
    assert_true(!r.error.cause.empty(), label + ": cause recorded");
}

static void test_empty_address()
{
    ParseResult r = parse_server_address("");
    assert_true(r.error.kind == ResolveErrorKind::EmptyAddress, "empty -> EmptyAddress");
    assert_true(r.spec.host.empty() && r.spec.port.empty(), "empty -> no spec");
}

static void test_host_and_port()
{
    expect_host_port("fileserver:1445", "fileserver", "1445");
    expect_host_port("fileserver", "fileserver", "445");
    expect_host_port("nas.local", "nas.local", "445");
    expect_host_port("fileserver:", "fileserver", "445");
    expect_host_port("10.0.0.5", "10.0.0.5", "445");
    expect_host_port("10.0.0.5:139", "10.0.0.5", "139");
}

static void test_bracketed_ipv6()
{
    expect_host_port("[fe80::1]", "fe80::1", "445");
    expect_host_port("[::1]", "::1", "445");
    expect_host_port("[2001:db8::10]:1445", "2001:db8::10", "1445");
    expect_host_port("[::1]:", "::1", "445");
    // bracket contents are taken verbatim
    expect_host_port("[fe80::1%eth0]", "fe80::1%eth0", "445");
}

static void test_bracket_with_trailing_text()
{
    // no port after the brackets: brackets trimmed from the ends, the rest kept
    expect_host_port("[fe80::1]x", "fe80::1]x", "445");
    expect_host_port("[::1]]:445", "::1]]:445", "445");
    expect_host_port("[fileserver", "fileserver", "445");
}

static void test_bare_ipv6_literal()
{
    expect_host_port("fe80::1", "fe80::1", "445");
    expect_host_port("::1", "::1", "445");
    expect_host_port("2001:db8::1:445", "2001:db8::1:445", "445");
}

static void test_malformed()
{
    expect_parse_error("a:b:c");
    expect_parse_error("[::1");
    expect_parse_error("[[]");
    expect_parse_error("host:abc");
    expect_parse_error("host:70000");
    expect_parse_error(":445");
    expect_parse_error("[]");
}

static void test_ip_literal_canonical()
{
    auto v4 = parse_ip_literal("10.0.0.5");
    assert_true(v4 && v4->af == AF_INET, "v4 literal");
    assert_eq(v4->ip, "10.0.0.5", "v4 canonical");

    auto v6 = parse_ip_literal("2001:DB8:0::1");
    assert_true(v6 && v6->af == AF_INET6, "v6 literal");
    assert_eq(v6->ip, "2001:db8::1", "v6 canonical");

    assert_true(!parse_ip_literal("fileserver"), "name is not a literal");
    assert_true(!parse_ip_literal("[::1]"), "brackets are not a literal");
    assert_true(!parse_ip_literal("fe80::1%eth0"), "zone is not a literal");
    assert_true(!parse_ip_literal(""), "empty is not a literal");

    // v4 and its v4-mapped form stay distinct (no unification)
    auto mapped = parse_ip_literal("::ffff:10.0.0.5");
    assert_true(mapped && mapped->af == AF_INET6, "mapped literal");
    assert_true(!(*mapped == *v4), "v4 != v4-mapped v6");
}

static void test_join_host_port()
{
    assert_eq(join_host_port("10.0.0.5", "445"), "10.0.0.5:445", "join v4");
    assert_eq(join_host_port("fe80::1", "1445"), "[fe80::1]:1445", "join v6");
}

static Address addr(const char *text)
{
    auto a = parse_ip_literal(text);
    assert_true(a.has_value(), "test literal");
    return *a;
}

static void test_dedupe_order_and_invalid()
{
    const Address a = addr("192.168.1.10");
    const Address b = addr("fe80::10");
    std::vector<Address> in{a, a, b, Address{}, b};
    auto out = dedupe_addresses(in);
    assert_true(out.size() == 2, "dedupe size");
    assert_eq(out[0].ip, a.ip, "dedupe first");
    assert_eq(out[1].ip, b.ip, "dedupe second");

    auto reordered = dedupe_addresses({b, a, b});
    assert_true(reordered.size() == 2, "stable size");
    assert_eq(reordered[0].ip, b.ip, "first-seen kept first");
    assert_eq(reordered[1].ip, a.ip, "then second");
}

static void test_dedupe_small_inputs()
{
    assert_true(dedupe_addresses({}).empty(), "empty stays empty");
    auto one = dedupe_addresses({addr("10.0.0.5")});
    assert_true(one.size() == 1 && one[0].ip == "10.0.0.5", "single unchanged");
    assert_true(dedupe_addresses({Address{}}).empty(), "single invalid dropped");
}

static void test_dedupe_keeps_mapped_distinct()
{
    auto out = dedupe_addresses({addr("10.0.0.1"), addr("::ffff:10.0.0.1"), addr("10.0.0.1")});
    assert_true(out.size() == 2, "v4 and v4-mapped are not merged");
}

int main()
{
    test_empty_address();
    test_host_and_port();
    test_bracketed_ipv6();
    test_bracket_with_trailing_text();
    test_bare_ipv6_literal();
    test_malformed();
    test_ip_literal_canonical();
    test_join_host_port();
    test_dedupe_order_and_invalid();
    test_dedupe_small_inputs();
    test_dedupe_keeps_mapped_distinct();

    std::cout << "address tests: OK" << std::endl;
    return 0;
}
