#pragma once

#include "strata/console.hpp"
#include "strata/layer_store.hpp"
#include "strata/process_exec.hpp"
#include "strata/utility.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/// Must exist under every verified mount: the package manager.
inline constexpr const char *MOUNT_SENTINEL = "usr/bin/apt";

/**
 * @brief Drives the external union-mount facility.
 *
 * Stateless: pairing mounts with unmounts is the job of `MountStack`.
 */
class OverlayMounter {
public:
    explicit OverlayMounter(CommandRunner &runner) : runner_(runner) {
    }

    /**
     * @brief Mounts an overlay of `upper` on `lower` at `mount_point`.
     *
     * `mount_point` must be empty. After the mount call the sentinel must be
     * visible under `mount_point`, otherwise the mount is released again and
     * `ErrorKind::MountVerificationFailure` is returned.
     */
    Result<void> mount(const std::filesystem::path &lower, const std::filesystem::path &upper,
                       const std::filesystem::path &work, const std::filesystem::path &mount_point);

    Result<void> unmount(const std::filesystem::path &mount_point);

    /**
     * @brief Unmounts whatever a dead session left mounted at `mount_point`.
     *
     * The caller must hold the exclusive lock of the layer owning the mount
     * point, so nothing alive can be using it.
     *
     * @return `false` if there was nothing to release.
     */
    Result<bool> release_orphan(const std::filesystem::path &mount_point);

private:
    CommandRunner &runner_;
};

/**
 * @brief Releases orphaned L2i, L3 and L2 mounts of `fingerprint`, topmost first.
 *
 * Requires the exclusive L2 lock of `fingerprint`: every live session using
 * any of these mounts holds it.
 */
Result<void> release_orphaned_mounts(OverlayMounter &mounter, const LayerStore &store, std::string_view fingerprint,
                                     Console &console);

/// Overlay mount points at or below `root` in a `/proc/self/mounts` style table.
std::vector<std::string> overlay_mounts_under(std::istream &table, const std::filesystem::path &root);

/**
 * @brief Scoped ownership of a sequence of stacked mounts.
 *
 * Every successful `push` is undone exactly once, innermost first: by `pop`,
 * by `release_all`, or by the destructor on any exit path.
 */
class MountStack {
public:
    MountStack(OverlayMounter &mounter, Console &console) : mounter_(mounter), console_(console) {
    }
    ~MountStack();

    MountStack(const MountStack &) = delete;
    MountStack &operator=(const MountStack &) = delete;

    Result<void> push(const std::filesystem::path &lower, const std::filesystem::path &upper,
                      const std::filesystem::path &work, const std::filesystem::path &mount_point);

    /// Unmounts the innermost mount.
    Result<void> pop();

    /**
     * @brief Unmounts everything, innermost first.
     *
     * Keeps going after a failed unmount; the first failure is returned.
     */
    Result<void> release_all();

    size_t depth() const {
        return mounted_.size();
    }
    const std::vector<std::filesystem::path> &mounted() const {
        return mounted_;
    }

private:
    OverlayMounter &mounter_;
    Console &console_;
    std::vector<std::filesystem::path> mounted_;
};

} // namespace strata
