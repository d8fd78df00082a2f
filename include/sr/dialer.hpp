#pragma once

#include <string>
#include <vector>

#include "sr/budget.hpp"
#include "sr/model.hpp"

namespace sr
{
// Connects over TCP to each address in order until one accepts.
// On success the connected descriptor is handed to the caller (DialResult::fd);
// every other socket is closed before returning.
DialResult dial_first(const Budget &budget,
                      const std::vector<Address> &addresses,
                      const std::string &port);
} // namespace sr
