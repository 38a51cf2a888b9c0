#pragma once

#include "strata/fingerprint.hpp"
#include "strata/process_exec.hpp"
#include "strata/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class Tier {
    L1,  ///< base system, keyed by codename
    L2,  ///< installed build dependencies, keyed by fingerprint
    L3,  ///< build workspace, keyed by fingerprint
    L2i, ///< transient install layer, keyed by fingerprint
};

std::string_view tier_dir(Tier tier);
std::string_view tier_name(Tier tier);

enum class LayerState {
    Absent,
    Creating,
    Ready,
    Mounted,
    Stale,
};

std::string_view to_string(LayerState state);

struct LayerPaths {
    std::filesystem::path content; ///< persisted upper dir
    std::filesystem::path work;    ///< overlay scratch, only read by the mount facility
    std::filesystem::path mount;
};

struct Layer {
    Tier tier;
    std::string id;
    LayerPaths paths;
    LayerState state = LayerState::Absent;
};

struct LayerInfo {
    std::string id;
    std::filesystem::path content;
    double age_days = 0;
};

/// Name of the manifest file inside an L2 content dir.
inline constexpr const char *MANIFEST_NAME = ".deps.strata";

/**
 * @brief On-disk layout of the layer cache.
 *
 * `cache_root/<tier>/{fs,overlay_work,overlay_mount}/<id>`
 */
class LayerStore {
public:
    LayerStore(std::filesystem::path cache_root, CommandRunner &runner);

    const std::filesystem::path &root() const {
        return root_;
    }

    /// Pure function of its inputs; does not touch the filesystem.
    LayerPaths paths_for(Tier tier, std::string_view id) const;

    /**
     * @brief Creates the content, work and mount directories of a new layer.
     * @return `ErrorKind::LayerConflict` if the content dir already exists.
     */
    Result<Layer> create_layer_dirs(Tier tier, std::string_view id);

    Result<Layer> probe(Tier tier, std::string_view id) const;

    /// Persisted layers of a tier, oldest first.
    Result<std::vector<LayerInfo>> list(Tier tier) const;

    /// Marks a layer as just used, for age-based eviction.
    Result<void> touch(Tier tier, std::string_view id);

    /// Deletes all three directories of a layer. Contents are root-owned.
    Result<void> remove_layer(Tier tier, std::string_view id);

    static Result<void> write_manifest(const std::filesystem::path &dir, const DependencySet &deps);
    static Result<DependencySet> read_manifest(const std::filesystem::path &content);

private:
    std::filesystem::path root_;
    CommandRunner &runner_;
};

/// Identifiers become path components: no separators, no `.`/`..`.
Result<void> validate_layer_id(std::string_view id);

} // namespace strata
