#include "strata/layer_store.hpp"

#include "strata/utility.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

namespace strata {

namespace {

bool dir_has_entries(const std::filesystem::path &dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
        return false;
    return !std::filesystem::is_empty(dir, ec) && !ec;
}

bool is_epoch(std::string_view field) {
    return !field.empty() && std::all_of(field.begin(), field.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

std::string_view tier_dir(Tier tier) {
    switch (tier) {
    case Tier::L1:
        return "l1";
    case Tier::L2:
        return "l2";
    case Tier::L3:
        return "l3";
    case Tier::L2i:
        return "l2i";
    }
    return "unknown";
}

std::string_view tier_name(Tier tier) {
    switch (tier) {
    case Tier::L1:
        return "L1";
    case Tier::L2:
        return "L2";
    case Tier::L3:
        return "L3";
    case Tier::L2i:
        return "L2i";
    }
    return "unknown";
}

std::string_view to_string(LayerState state) {
    switch (state) {
    case LayerState::Absent:
        return "absent";
    case LayerState::Creating:
        return "creating";
    case LayerState::Ready:
        return "ready";
    case LayerState::Mounted:
        return "mounted";
    case LayerState::Stale:
        return "stale";
    }
    return "unknown";
}

Result<void> validate_layer_id(std::string_view id) {
    if (id.empty() || id == "." || id == ".." || id.find('/') != std::string_view::npos ||
        id.find('\0') != std::string_view::npos) {
        return fail(ErrorKind::InvalidArgument, "Invalid layer identifier '{}'", id);
    }
    return {};
}

LayerStore::LayerStore(std::filesystem::path cache_root, CommandRunner &runner)
    : root_(std::move(cache_root)), runner_(runner) {
}

LayerPaths LayerStore::paths_for(Tier tier, std::string_view id) const {
    const auto base = root_ / tier_dir(tier);
    return {
        .content = base / "fs" / id,
        .work = base / "overlay_work" / id,
        .mount = base / "overlay_mount" / id,
    };
}

Result<Layer> LayerStore::create_layer_dirs(Tier tier, std::string_view id) {
    if (auto res = validate_layer_id(id); !res)
        return std::unexpected(res.error());

    Layer layer{.tier = tier, .id = std::string(id), .paths = paths_for(tier, id), .state = LayerState::Creating};

    std::error_code ec;
    if (std::filesystem::exists(layer.paths.content, ec)) {
        return fail(ErrorKind::LayerConflict, "{} layer {} already exists at {}", tier_name(tier), id,
                    layer.paths.content.string());
    }

    for (const auto &dir : {layer.paths.content, layer.paths.work, layer.paths.mount}) {
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return fail(ErrorKind::IoFailure, "Cannot create {}: {}", dir.string(), ec.message());
    }
    return layer;
}

Result<Layer> LayerStore::probe(Tier tier, std::string_view id) const {
    if (auto res = validate_layer_id(id); !res)
        return std::unexpected(res.error());

    Layer layer{.tier = tier, .id = std::string(id), .paths = paths_for(tier, id)};

    std::error_code ec;
    if (!std::filesystem::exists(layer.paths.content, ec)) {
        layer.state = LayerState::Absent;
    } else if (dir_has_entries(layer.paths.mount)) {
        layer.state = LayerState::Mounted;
    } else if (tier == Tier::L2 && !std::filesystem::exists(layer.paths.content / MANIFEST_NAME, ec)) {
        // creation was interrupted before the dependency list was persisted
        layer.state = LayerState::Stale;
    } else {
        layer.state = LayerState::Ready;
    }
    return layer;
}

Result<std::vector<LayerInfo>> LayerStore::list(Tier tier) const {
    std::vector<LayerInfo> layers;
    const auto fs_dir = root_ / tier_dir(tier) / "fs";

    std::error_code ec;
    if (!std::filesystem::is_directory(fs_dir, ec))
        return layers;

    const auto now = std::filesystem::file_time_type::clock::now();
    std::filesystem::directory_iterator it(fs_dir, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code stat_ec;
        if (!it->is_directory(stat_ec))
            continue;
        auto mtime = std::filesystem::last_write_time(it->path(), stat_ec);
        if (stat_ec)
            return fail(ErrorKind::IoFailure, "Cannot stat {}: {}", it->path().string(), stat_ec.message());

        const std::chrono::duration<double, std::ratio<86400>> age = now - mtime;
        layers.push_back({.id = it->path().filename().string(), .content = it->path(), .age_days = age.count()});
    }
    if (ec)
        return fail(ErrorKind::IoFailure, "Cannot list {}: {}", fs_dir.string(), ec.message());

    std::sort(layers.begin(), layers.end(),
              [](const LayerInfo &a, const LayerInfo &b) { return a.age_days > b.age_days; });
    return layers;
}

Result<void> LayerStore::touch(Tier tier, std::string_view id) {
    const auto content = paths_for(tier, id).content;
    std::error_code ec;
    std::filesystem::last_write_time(content, std::filesystem::file_time_type::clock::now(), ec);
    if (ec)
        return fail(ErrorKind::IoFailure, "Cannot update timestamp of {}: {}", content.string(), ec.message());
    return {};
}

Result<void> LayerStore::remove_layer(Tier tier, std::string_view id) {
    if (auto res = validate_layer_id(id); !res)
        return std::unexpected(res.error());

    const auto paths = paths_for(tier, id);
    auto res = runner_.run_checked({
        .args = {"rm", "-rf", "--", paths.content.string(), paths.work.string(), paths.mount.string()},
        .privileged = true,
        .quiet = true,
    });
    if (!res)
        return std::unexpected(res.error());
    return {};
}

Result<void> LayerStore::write_manifest(const std::filesystem::path &dir, const DependencySet &deps) {
    const auto target = dir / MANIFEST_NAME;
    const auto tmp = dir / (std::string(MANIFEST_NAME) + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
            return fail(ErrorKind::IoFailure, "Cannot write manifest {}", tmp.string());
        for (size_t i = 0; i < deps.size(); ++i) {
            if (i > 0)
                out << '\n';
            out << deps[i].name << ':' << deps[i].version;
        }
        out.flush();
        if (!out)
            return fail(ErrorKind::IoFailure, "Cannot write manifest {}", tmp.string());
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec)
        return fail(ErrorKind::IoFailure, "Cannot move manifest into place at {}: {}", target.string(), ec.message());
    return {};
}

Result<DependencySet> LayerStore::read_manifest(const std::filesystem::path &content) {
    const auto path = content / MANIFEST_NAME;
    std::ifstream in(path);
    if (!in.is_open())
        return fail(ErrorKind::IoFailure, "Cannot read manifest {}", path.string());

    DependencySet deps;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == line.size())
            return fail(ErrorKind::ParseFailure, "Malformed manifest entry '{}' in {}", line, path.string());
        // "name:arch:version" for foreign-architecture packages; an epoch is all digits
        size_t second = line.find(':', colon + 1);
        if (second != std::string::npos && second + 1 < line.size() &&
            !is_epoch(std::string_view(line).substr(colon + 1, second - colon - 1)))
            colon = second;
        deps.push_back({line.substr(0, colon), line.substr(colon + 1)});
    }
    return deps;
}

} // namespace strata
