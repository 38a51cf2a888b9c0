#pragma once

#include "strata/layer_store.hpp"
#include "strata/utility.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace strata {

enum class LockMode {
    Shared,
    Exclusive,
};

/**
 * @brief Advisory lock on one (tier, identifier), held for the object's lifetime.
 *
 * Backed by `flock` on `cache_root/locks/<tier>_<id>.lock`; the kernel drops
 * it if the process dies.
 */
class LayerLock {
public:
    /// Blocks until the lock is granted.
    static Result<LayerLock> acquire(const std::filesystem::path &cache_root, Tier tier, std::string_view id,
                                     LockMode mode);

    /// Returns `std::nullopt` when another holder has it.
    static Result<std::optional<LayerLock>> try_acquire(const std::filesystem::path &cache_root, Tier tier,
                                                        std::string_view id, LockMode mode);

    LayerLock(LayerLock &&other) noexcept;
    LayerLock &operator=(LayerLock &&other) noexcept;
    LayerLock(const LayerLock &) = delete;
    LayerLock &operator=(const LayerLock &) = delete;
    ~LayerLock();

    LockMode mode() const {
        return mode_;
    }

private:
    LayerLock(int fd, LockMode mode) : fd_(fd), mode_(mode) {
    }

    static Result<std::optional<LayerLock>> lock(const std::filesystem::path &cache_root, Tier tier,
                                                 std::string_view id, LockMode mode, bool blocking);

    int fd_ = -1;
    LockMode mode_;
};

} // namespace strata
