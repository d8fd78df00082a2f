#pragma once

#include <string>
#include <vector>

namespace sr
{
const char *family_str(int af);

// Forward declarations to avoid heavy includes in header
struct Options;
struct Address;
struct TierAttempt;
struct ResolveError;
struct ServerReport;

// Text formatting (returns complete text block with trailing newlines when applicable)
std::string format_header_text(const Options &opt);

std::string format_addresses_text(const std::vector<Address> &addresses);

std::string format_attempts_text(const std::vector<TierAttempt> &attempts);

std::string format_error_text(const ResolveError &error);

std::string format_report_text(const ServerReport &report, bool verbose);

std::string format_paths_text(const std::vector<std::string> &paths);

// JSON builders (single object string without trailing newline)
std::string build_report_json(const ServerReport &report);

std::string build_final_json(const Options &opt,
                             const std::vector<ServerReport> &reports);
} // namespace sr
