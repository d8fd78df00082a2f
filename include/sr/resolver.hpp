#pragma once

#include <string>

#include "sr/budget.hpp"
#include "sr/model.hpp"

namespace sr
{
// getaddrinfo based lookup bounded by the budget.
// - IP literals return immediately without any network call
// - an expired/cancelled budget returns Cancelled before any I/O
// - rc != 0 maps to LookupFailed with gai_strerror(rc) as cause
LookupResult lookup_unicast(const Budget &budget, const std::string &hostname);
} // namespace sr
