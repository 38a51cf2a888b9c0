#pragma once

#include "strata/console.hpp"
#include "strata/utility.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/// Thresholds for reclaiming L2 layers.
struct EvictionPolicy {
    int max_age_days = 30;
    std::size_t max_count = 10;
};

struct Config {
    std::filesystem::path cache_dir = "/var/cache/strata";
    std::filesystem::path export_dir = "../build-area/";
    std::string mirror = "http://deb.debian.org/debian";

    // applied to the build step only, never to L1/L2 creation
    std::vector<std::string> drop_capability;
    std::string system_call_filter;
    bool private_network = true;

    EvictionPolicy eviction;
    std::vector<std::string> privilege_command = {"sudo"};
    ConsoleStyle style;

    /**
     * @brief Parses a JSON configuration document.
     *
     * Missing keys keep their defaults. Type errors and invalid values are
     * reported as `ErrorKind::ConfigurationError`.
     */
    static Result<Config> from_json(std::string_view text);

    /**
     * @brief Loads the configuration from `path`.
     *
     * When `generate_if_missing` is set and the file does not exist, a file
     * holding the defaults is written there first.
     */
    static Result<Config> load(const std::filesystem::path &path, bool generate_if_missing);

    /// `$XDG_CONFIG_HOME/strata.json`, or `~/.config/strata.json`.
    static std::filesystem::path default_path();

    static std::string default_document();

    Result<void> validate() const;
};

} // namespace strata
