#include "strata/layer_lock.hpp"

#include "strata/utility.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace strata {

Result<std::optional<LayerLock>> LayerLock::lock(const std::filesystem::path &cache_root, Tier tier,
                                                 std::string_view id, LockMode mode, bool blocking) {
    if (auto res = validate_layer_id(id); !res)
        return std::unexpected(res.error());

    const auto dir = cache_root / "locks";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return fail(ErrorKind::IoFailure, "Cannot create {}: {}", dir.string(), ec.message());

    const auto path = dir / std::format("{}_{}.lock", tier_dir(tier), id);
    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd == -1)
        return fail(ErrorKind::IoFailure, "Cannot open lock {}: {}", path.string(), std::strerror(errno));

    int op = (mode == LockMode::Shared ? LOCK_SH : LOCK_EX) | (blocking ? 0 : LOCK_NB);
    int rc;
    do {
        rc = flock(fd, op);
    } while (rc == -1 && errno == EINTR);

    if (rc == -1) {
        int err = errno;
        close(fd);
        if (!blocking && err == EWOULDBLOCK)
            return std::optional<LayerLock>{};
        return fail(ErrorKind::IoFailure, "Cannot lock {}: {}", path.string(), std::strerror(err));
    }
    return std::optional<LayerLock>{LayerLock(fd, mode)};
}

Result<LayerLock> LayerLock::acquire(const std::filesystem::path &cache_root, Tier tier, std::string_view id,
                                     LockMode mode) {
    auto res = lock(cache_root, tier, id, mode, true);
    if (!res)
        return std::unexpected(res.error());
    return std::move(**res);
}

Result<std::optional<LayerLock>> LayerLock::try_acquire(const std::filesystem::path &cache_root, Tier tier,
                                                        std::string_view id, LockMode mode) {
    return lock(cache_root, tier, id, mode, false);
}

LayerLock::LayerLock(LayerLock &&other) noexcept : fd_(other.fd_), mode_(other.mode_) {
    other.fd_ = -1;
}

LayerLock &LayerLock::operator=(LayerLock &&other) noexcept {
    if (this != &other) {
        if (fd_ != -1)
            close(fd_);
        fd_ = other.fd_;
        mode_ = other.mode_;
        other.fd_ = -1;
    }
    return *this;
}

LayerLock::~LayerLock() {
    // closing the descriptor drops the flock
    if (fd_ != -1)
        close(fd_);
}

} // namespace strata
