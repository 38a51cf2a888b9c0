#pragma once

#include "strata/config.hpp"
#include "strata/console.hpp"
#include "strata/eviction.hpp"
#include "strata/fingerprint.hpp"
#include "strata/layer_lock.hpp"
#include "strata/layer_store.hpp"
#include "strata/mount.hpp"
#include "strata/nspawn.hpp"
#include "strata/process_exec.hpp"
#include "strata/utility.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class SessionState {
    NeedL1,
    L1Ready,
    NeedL2,
    L2Ready,
    NeedL3,
    L3Ready,
    Done,
    Failed,
};

std::string_view to_string(SessionState state);

/// Extensions of the files a package build leaves next to the source tree.
inline constexpr std::array<std::string_view, 6> ARTIFACT_EXTENSIONS = {".deb", ".changes", ".xz",
                                                                        ".gz",  ".buildinfo", ".dsc"};

struct BuildRequest {
    std::string codename = "sid";
    std::filesystem::path source_dir;
    std::vector<std::string> extra_args; ///< passed verbatim to the build tool
};

/**
 * @brief Everything one build invocation decided and produced.
 */
struct BuildSession {
    std::string codename;
    std::filesystem::path source_dir;
    std::vector<std::string> extra_args;
    std::string machine;

    SessionState state = SessionState::NeedL1;
    std::optional<Layer> l1;
    std::optional<Layer> l2;
    std::optional<Layer> l3;
    Resolution resolution;
    bool l2_cache_hit = false;
    bool success = false;
    std::vector<std::filesystem::path> artifacts;
};

/**
 * @brief Creates, reuses and stacks the three cache tiers.
 *
 * L1 is the base system per codename, L2 the base system plus the installed
 * build dependencies per fingerprint, L3 the throw-away layer the build runs
 * in. Every operation releases its mounts and locks before returning,
 * whatever the outcome.
 */
class CacheManager {
public:
    CacheManager(Config config, CommandRunner &runner, Console &console);

    /// Bootstraps a new base system. `ErrorKind::LayerConflict` if one exists.
    Result<Layer> create_base(const std::string &codename);

    /**
     * @brief Refreshes an existing base system in place.
     *
     * L2 layers built on the old state are left alone; they may be stale
     * until their fingerprint changes.
     */
    Result<void> update_base(const std::string &codename);

    /// Runs a package build of `req.source_dir`, exporting the artifacts.
    Result<BuildSession> build(const BuildRequest &req);

    /**
     * @brief Installs package files with their dependencies into a temporary
     *        layer on top of the source tree's L2.
     *
     * @return The package tool's exit status.
     */
    Result<int> install(const BuildRequest &req, const std::vector<std::filesystem::path> &packages);

    Result<EvictionReport> purge();

    /// Prints overlay mounts, build containers and layers.
    Result<void> show();

    const LayerStore &store() const {
        return store_;
    }

private:
    /// Held for the duration of one operation; mounts are released before locks.
    struct SessionResources {
        std::optional<LayerLock> l1_lock;
        std::optional<LayerLock> l2_lock;
        std::optional<LayerLock> top_lock; ///< L3 or L2i
        MountStack mounts;
    };

    Result<Layer> bootstrap(const std::string &codename);
    Result<void> prepare_l1(BuildSession &session, SessionResources &res);
    Result<void> resolve_deps(BuildSession &session);
    Result<void> prepare_l2(BuildSession &session, SessionResources &res);
    Result<void> populate_l2(BuildSession &session, Layer &l2);
    Result<Layer> fresh_layer(Tier tier, const std::string &id);
    Result<void> run_build(BuildSession &session, SessionResources &res);
    Result<int> run_install(BuildSession &session, SessionResources &res,
                            const std::vector<std::filesystem::path> &packages);
    Result<void> copy_into(const std::filesystem::path &from, const std::filesystem::path &to);
    Result<std::vector<std::filesystem::path>> export_artifacts(const BuildSession &session);
    void advance(BuildSession &session, SessionState next);
    BuildSession new_session(const BuildRequest &req) const;
    NamespaceOptions namespace_for(const BuildSession &session, const Layer &layer) const;

    Config config_;
    CommandRunner &runner_;
    Console &console_;
    LayerStore store_;
    OverlayMounter mounter_;
};

} // namespace strata
