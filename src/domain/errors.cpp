#include "sr/model.hpp"

namespace sr {

const char* error_kind_str(ResolveErrorKind k)
{
    switch (k)
    {
        case ResolveErrorKind::None: return "none";
        case ResolveErrorKind::EmptyAddress: return "empty_address";
        case ResolveErrorKind::AddressParse: return "address_parse";
        case ResolveErrorKind::LookupFailed: return "lookup_failed";
        case ResolveErrorKind::NoAddresses: return "no_addresses";
        case ResolveErrorKind::NoResponses: return "no_responses";
        case ResolveErrorKind::Cancelled: return "cancelled";
        case ResolveErrorKind::InvalidName: return "invalid_name";
        case ResolveErrorKind::Socket: return "socket";
        case ResolveErrorKind::Aggregate: return "aggregate";
        case ResolveErrorKind::Connect: return "connect";
    }
    return "unknown";
}

} // namespace sr
