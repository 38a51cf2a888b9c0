#pragma once

#include "strata/process_exec.hpp"
#include "strata/utility.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace strata {

/// In-container path where the source tree is bound or copied.
inline constexpr const char *CONTAINER_SRC_DIR = "/srv";

struct OverlayBinding {
    std::filesystem::path host_dir;
    std::string container_dir;
};

struct NamespaceOptions {
    std::filesystem::path root;
    std::string machine = "strata";
    std::string chdir = CONTAINER_SRC_DIR;
    bool read_only = false;
    bool private_network = false;
    std::vector<OverlayBinding> overlays;
    std::vector<std::string> drop_capability;
    std::string system_call_filter;
    std::map<std::string, std::string> env;
};

/**
 * @brief Builds the `systemd-nspawn` command line running `inner` inside
 *        `opts.root`.
 */
std::vector<std::string> nspawn_args(const NamespaceOptions &opts, const std::vector<std::string> &inner);

/**
 * @brief Runs `inner` inside an isolated namespace rooted at `opts.root`.
 *
 * @param checked Convert a non-zero exit status into an error.
 */
Result<CommandOutput> nspawn(CommandRunner &runner, const NamespaceOptions &opts,
                             const std::vector<std::string> &inner, bool quiet = false, bool checked = true);

} // namespace strata
