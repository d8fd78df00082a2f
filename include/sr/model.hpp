#pragma once

#include <string>
#include <vector>

namespace sr {

struct Address {
    int         af{};       // AF_INET / AF_INET6
    std::string ip;         // canonical text form (inet_ntop)

    bool valid() const { return !ip.empty(); }
};

// Equality is by canonical string only: 10.0.0.1 != ::ffff:10.0.0.1
inline bool operator==(const Address& a, const Address& b) { return a.ip == b.ip; }

struct HostSpec {
    std::string host;
    std::string port;       // never empty, decimal
};

enum class ResolveErrorKind {
    None = 0,
    EmptyAddress,
    AddressParse,
    LookupFailed,
    NoAddresses,
    NoResponses,
    Cancelled,
    InvalidName,
    Socket,
    Aggregate,
    Connect,
};

struct ResolveError {
    ResolveErrorKind kind{ResolveErrorKind::None};
    std::string      message;   // user-facing text
    std::string      cause;     // underlying error (wrapped), may be empty
    ResolveErrorKind cause_kind{ResolveErrorKind::None};  // set for Aggregate
    int              rc{};      // getaddrinfo rc / errno when applicable

    explicit operator bool() const { return kind != ResolveErrorKind::None; }
};

struct ParseResult {
    HostSpec     spec;
    ResolveError error;
};

struct LookupResult {
    double               ms{};
    std::vector<Address> addresses;
    ResolveError         error;
};

struct TierAttempt {
    std::string          strategy;
    std::string          hostname;
    double               ms{};
    std::vector<Address> addresses;
    ResolveError         error;
    bool                 skipped{};  // deadline already elapsed, not run
};

struct ResolveResult {
    std::string              host;
    double                   ms{};
    std::vector<Address>     addresses;  // deduplicated, preference order
    std::vector<TierAttempt> attempts;
    ResolveError             error;
};

struct DialResult {
    double       ms{};
    int          fd{-1};       // connected socket, owned by the caller when >= 0
    Address      address;      // address that accepted the connection
    int          tried{};
    ResolveError error;
};

const char* error_kind_str(ResolveErrorKind k);

} // namespace sr
