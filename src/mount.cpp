#include "strata/mount.hpp"

#include "strata/utility.hpp"

#include <format>
#include <sstream>
#include <system_error>

namespace strata {

namespace {

bool is_octal(char c) {
    return c >= '0' && c <= '7';
}

/// The kernel escapes space, tab, newline and backslash in mount table fields as `\ooo`.
std::string unescape_mount_field(std::string_view field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() && is_octal(field[i + 1]) && is_octal(field[i + 2]) &&
            is_octal(field[i + 3])) {
            out += static_cast<char>((field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0'));
            i += 3;
        } else {
            out += field[i];
        }
    }
    return out;
}

} // namespace

Result<void> OverlayMounter::mount(const std::filesystem::path &lower, const std::filesystem::path &upper,
                                   const std::filesystem::path &work, const std::filesystem::path &mount_point) {
    std::error_code ec;
    if (!std::filesystem::is_directory(mount_point, ec)) {
        return fail(ErrorKind::MountVerificationFailure, "Mount point {} does not exist", mount_point.string());
    }
    if (!std::filesystem::is_empty(mount_point, ec) || ec) {
        return fail(ErrorKind::MountVerificationFailure, "Mount point {} is not empty (stale mount?)",
                    mount_point.string());
    }

    std::string data =
        std::format("-olowerdir={},upperdir={},workdir={}", lower.string(), upper.string(), work.string());
    auto res = runner_.run_checked({
        .args = {"mount", "-t", "overlay", "overlay", data, mount_point.string()},
        .privileged = true,
    });
    if (!res)
        return std::unexpected(res.error());

    if (!std::filesystem::is_regular_file(mount_point / MOUNT_SENTINEL, ec)) {
        Error err{ErrorKind::MountVerificationFailure,
                  std::format("{} not found under {} after mount", MOUNT_SENTINEL, mount_point.string())};
        if (auto undo = unmount(mount_point); !undo)
            err.message += std::format("; releasing it failed too: {}", undo.error().message);
        return std::unexpected(err);
    }
    return {};
}

Result<void> OverlayMounter::unmount(const std::filesystem::path &mount_point) {
    auto res = runner_.run_checked({.args = {"umount", mount_point.string()}, .privileged = true});
    if (!res)
        return std::unexpected(res.error());
    return {};
}

Result<bool> OverlayMounter::release_orphan(const std::filesystem::path &mount_point) {
    std::error_code ec;
    if (!std::filesystem::is_directory(mount_point, ec))
        return false;
    bool empty = std::filesystem::is_empty(mount_point, ec);
    if (ec)
        return fail(ErrorKind::IoFailure, "Cannot read {}: {}", mount_point.string(), ec.message());
    if (empty)
        return false;

    if (auto res = unmount(mount_point); !res)
        return std::unexpected(res.error());
    empty = std::filesystem::is_empty(mount_point, ec);
    if (ec || !empty) {
        return fail(ErrorKind::MountVerificationFailure, "{} is not empty after unmounting it",
                    mount_point.string());
    }
    return true;
}

Result<void> release_orphaned_mounts(OverlayMounter &mounter, const LayerStore &store, std::string_view fingerprint,
                                     Console &console) {
    for (Tier tier : {Tier::L2i, Tier::L3, Tier::L2}) {
        const auto mount_point = store.paths_for(tier, fingerprint).mount;
        auto released = mounter.release_orphan(mount_point);
        if (!released)
            return std::unexpected(released.error());
        if (*released)
            console.info("[{}] Released mount left behind at {}", tier_name(tier), mount_point.string());
    }
    return {};
}

std::vector<std::string> overlay_mounts_under(std::istream &table, const std::filesystem::path &root) {
    std::string base = root.string();
    while (base.size() > 1 && base.back() == '/')
        base.pop_back();
    const std::string prefix = base + "/";

    std::vector<std::string> mounts;
    std::string line;
    while (std::getline(table, line)) {
        std::istringstream iss(line);
        std::string source, field, type;
        if (!(iss >> source >> field >> type) || type != "overlay")
            continue;
        std::string mount_point = unescape_mount_field(field);
        if (mount_point == base || mount_point.starts_with(prefix))
            mounts.push_back(std::move(mount_point));
    }
    return mounts;
}

MountStack::~MountStack() {
    if (auto res = release_all(); !res) {
        console_.error("Leaving mounts behind: {}", res.error());
    }
}

Result<void> MountStack::push(const std::filesystem::path &lower, const std::filesystem::path &upper,
                              const std::filesystem::path &work, const std::filesystem::path &mount_point) {
    if (auto res = mounter_.mount(lower, upper, work, mount_point); !res)
        return res;
    mounted_.push_back(mount_point);
    return {};
}

Result<void> MountStack::pop() {
    if (mounted_.empty())
        return {};
    auto mount_point = std::move(mounted_.back());
    mounted_.pop_back();
    return mounter_.unmount(mount_point);
}

Result<void> MountStack::release_all() {
    Result<void> first = {};
    while (!mounted_.empty()) {
        auto res = pop();
        if (!res && first)
            first = std::unexpected(res.error());
    }
    return first;
}

} // namespace strata
