#include "strata/nspawn.hpp"

#include <format>

namespace strata {

std::vector<std::string> nspawn_args(const NamespaceOptions &opts, const std::vector<std::string> &inner) {
    std::vector<std::string> args = {"systemd-nspawn", "-M", opts.machine, std::format("--chdir={}", opts.chdir)};

    if (!opts.drop_capability.empty()) {
        std::string caps;
        for (const auto &cap : opts.drop_capability) {
            if (!caps.empty())
                caps += ',';
            caps += cap;
        }
        args.push_back(std::format("--drop-capability={}", caps));
    }
    if (!opts.system_call_filter.empty())
        args.push_back(std::format("--system-call-filter={}", opts.system_call_filter));
    if (opts.private_network)
        args.emplace_back("--private-network");

    args.emplace_back("-D");
    args.push_back(opts.root.string());
    if (opts.read_only)
        args.emplace_back("--read-only");

    // lower only, no upper: writes inside the container land in a tmpfs
    for (const auto &overlay : opts.overlays)
        args.push_back(std::format("--overlay={}::{}", overlay.host_dir.string(), overlay.container_dir));
    for (const auto &[key, value] : opts.env) {
        args.emplace_back("-E");
        args.push_back(std::format("{}={}", key, value));
    }

    args.emplace_back("--");
    args.insert(args.end(), inner.begin(), inner.end());
    return args;
}

Result<CommandOutput> nspawn(CommandRunner &runner, const NamespaceOptions &opts,
                             const std::vector<std::string> &inner, bool quiet, bool checked) {
    Command cmd{.args = nspawn_args(opts, inner), .privileged = true, .quiet = quiet};
    if (checked)
        return runner.run_checked(cmd);
    return runner.run(cmd);
}

} // namespace strata
