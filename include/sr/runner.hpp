#pragma once

#include <functional>
#include <string>
#include <vector>

#include "sr/concurrency.hpp"
#include "sr/engine.hpp"
#include "sr/model.hpp"
#include "sr/options.hpp"

namespace sr {

// Everything known about one server argument after parsing, resolution
// and (optionally) dialing.
struct ServerReport {
    std::string   input;
    HostSpec      spec;
    ResolveError  parse_error;
    ResolveResult resolved;
    bool          dialed{};
    DialResult    dial;

    bool ok() const
    {
        return !parse_error && !resolved.error && (!dialed || !dial.error);
    }
};

using ReportCallback = std::function<void(int /*index (1-based)*/, const ServerReport&)>;

// Resolves one server argument with `resolver`.
ServerReport resolve_server(const HostResolver& resolver,
                            const std::string& input,
                            const Options& opt,
                            const std::atomic<bool>* cancel = nullptr);

// Resolves every opt.servers entry, at most opt.concurrency at a time.
// Reports are returned in argument order; on_report fires as each completes.
std::vector<ServerReport> run_servers(const HostResolver& resolver,
                                      const Options& opt,
                                      const ReportCallback& on_report,
                                      Cancellation* cancel = nullptr);

} // namespace sr
