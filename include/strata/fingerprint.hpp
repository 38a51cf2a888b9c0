#pragma once

#include "strata/nspawn.hpp"
#include "strata/process_exec.hpp"
#include "strata/utility.hpp"

#include <compare>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

struct Dependency {
    std::string name;
    std::string version;

    auto operator<=>(const Dependency &) const = default;
};

/// Deduplicated and sorted by (name, version).
using DependencySet = std::vector<Dependency>;

inline constexpr size_t FINGERPRINT_LEN = 10;

struct Resolution {
    DependencySet deps;
    std::string fingerprint;
};

/**
 * @brief Parses simulated `apt-get build-dep` output.
 *
 * Only lines starting with `"Inst "` are considered, e.g.
 * `Inst gettext (0.19.8.1-4 Debian:unstable [amd64]) []`.
 *
 * @return The canonical dependency set, or `ErrorKind::ParseFailure` for an
 *         `Inst` line without a parenthesised version.
 */
Result<DependencySet> parse_build_deps(const std::vector<std::string> &lines);

/// `[('name', 'version'), ...]` over an already canonical set.
std::string canonical_form(const DependencySet &deps);

/// First `FINGERPRINT_LEN` hex digits of the SHA-224 of `canonical_form(deps)`.
Result<std::string> fingerprint_of(const DependencySet &deps);

/**
 * @brief Resolves the build dependencies of `source_dir` against the base
 *        system `l1_dir`.
 *
 * Runs the dependency tool in simulate mode on a read-only root, with the
 * source tree overlaid at `/srv`. No persistent side effects.
 */
Result<Resolution> compute_fingerprint(CommandRunner &runner, const std::filesystem::path &l1_dir,
                                       const std::filesystem::path &source_dir, const std::string &machine);

} // namespace strata
