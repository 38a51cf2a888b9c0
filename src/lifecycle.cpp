#include "strata/lifecycle.hpp"

#include "strata/eviction.hpp"
#include "strata/layer_lock.hpp"
#include "strata/utility.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace strata {

namespace {

const std::map<std::string, std::string> NONINTERACTIVE = {{"DEBIAN_FRONTEND", "noninteractive"}};

bool is_artifact(const std::filesystem::path &path) {
    const auto ext = path.extension().string();
    return std::find(ARTIFACT_EXTENSIONS.begin(), ARTIFACT_EXTENSIONS.end(), ext) != ARTIFACT_EXTENSIONS.end();
}

/// Copies the artifacts found directly in `from` into `staging`; returns their names, sorted.
Result<std::vector<std::string>> stage_artifacts(const std::filesystem::path &from,
                                                 const std::filesystem::path &staging) {
    std::vector<std::string> names;
    std::error_code ec;
    std::filesystem::directory_iterator it(from, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec) || !is_artifact(it->path()))
            continue;
        auto name = it->path().filename().string();
        std::filesystem::copy_file(it->path(), staging / name, std::filesystem::copy_options::overwrite_existing,
                                   file_ec);
        if (file_ec)
            return fail(ErrorKind::IoFailure, "Cannot export {}: {}", it->path().string(), file_ec.message());
        names.push_back(std::move(name));
    }
    if (ec)
        return fail(ErrorKind::IoFailure, "Cannot list {}: {}", from.string(), ec.message());

    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

std::string_view to_string(SessionState state) {
    switch (state) {
    case SessionState::NeedL1:
        return "NEED_L1";
    case SessionState::L1Ready:
        return "L1_READY";
    case SessionState::NeedL2:
        return "NEED_L2";
    case SessionState::L2Ready:
        return "L2_READY";
    case SessionState::NeedL3:
        return "NEED_L3";
    case SessionState::L3Ready:
        return "L3_READY";
    case SessionState::Done:
        return "DONE";
    case SessionState::Failed:
        return "FAILED";
    }
    return "UNKNOWN";
}

CacheManager::CacheManager(Config config, CommandRunner &runner, Console &console)
    : config_(std::move(config)), runner_(runner), console_(console), store_(config_.cache_dir, runner),
      mounter_(runner) {
}

void CacheManager::advance(BuildSession &session, SessionState next) {
    console_.debug("[session] {} -> {}", to_string(session.state), to_string(next));
    session.state = next;
}

BuildSession CacheManager::new_session(const BuildRequest &req) const {
    BuildSession session;
    session.codename = req.codename;
    session.source_dir = req.source_dir;
    session.extra_args = req.extra_args;
    session.machine = std::format("strata-{}", getpid());
    return session;
}

NamespaceOptions CacheManager::namespace_for(const BuildSession &session, const Layer &layer) const {
    return {.root = layer.paths.mount, .machine = session.machine};
}

Result<void> CacheManager::copy_into(const std::filesystem::path &from, const std::filesystem::path &to) {
    auto res = runner_.run_checked({.args = {"cp", "-a", from.string(), to.string()}, .privileged = true});
    if (!res)
        return std::unexpected(res.error());
    return {};
}

// ---------------------------------------------------------------------------
// L1

Result<Layer> CacheManager::bootstrap(const std::string &codename) {
    auto layer = store_.create_layer_dirs(Tier::L1, codename);
    if (!layer)
        return layer;
    console_.info("[L1] Creating {}", layer->paths.content.string());

    auto populate = [&]() -> Result<void> {
        auto res = runner_.run_checked({
            .args = {"debootstrap", "--include=apt", "--force-check-gpg", codename, layer->paths.content.string(),
                     config_.mirror},
            .privileged = true,
        });
        if (!res)
            return std::unexpected(res.error());

        std::error_code ec;
        if (!std::filesystem::is_regular_file(layer->paths.content / MOUNT_SENTINEL, ec))
            return fail(ErrorKind::ExternalCommandFailure, "{} not found in {} after bootstrap", MOUNT_SENTINEL,
                        layer->paths.content.string());
        if (!std::filesystem::is_directory(layer->paths.content / "etc", ec))
            return fail(ErrorKind::ExternalCommandFailure, "/etc not found in {} after bootstrap",
                        layer->paths.content.string());
        return {};
    };

    if (auto res = populate(); !res) {
        // a half-bootstrapped L1 would otherwise be taken as ready next time
        if (auto cleanup = store_.remove_layer(Tier::L1, codename); !cleanup)
            console_.error("Cannot remove incomplete base system: {}", cleanup.error());
        return std::unexpected(res.error());
    }
    layer->state = LayerState::Ready;
    return layer;
}

Result<Layer> CacheManager::create_base(const std::string &codename) {
    if (auto res = validate_layer_id(codename); !res)
        return std::unexpected(res.error());
    auto lock = LayerLock::acquire(store_.root(), Tier::L1, codename, LockMode::Exclusive);
    if (!lock)
        return std::unexpected(lock.error());

    auto probe = store_.probe(Tier::L1, codename);
    if (!probe)
        return probe;
    if (probe->state != LayerState::Absent) {
        return fail(ErrorKind::LayerConflict, "the base filesystem (L1) for {} already exists at {}", codename,
                    probe->paths.content.string());
    }
    return bootstrap(codename);
}

Result<void> CacheManager::update_base(const std::string &codename) {
    if (auto res = validate_layer_id(codename); !res)
        return res;
    auto lock = LayerLock::acquire(store_.root(), Tier::L1, codename, LockMode::Exclusive);
    if (!lock)
        return std::unexpected(lock.error());

    auto l1 = store_.probe(Tier::L1, codename);
    if (!l1)
        return std::unexpected(l1.error());
    if (l1->state == LayerState::Absent) {
        return fail(ErrorKind::LayerMissing, "no base filesystem (L1) for {}; run create first", codename);
    }

    console_.info("[L1] Updating {}", l1->paths.content.string());
    NamespaceOptions opts{.root = l1->paths.content, .machine = std::format("strata-{}", getpid()), .chdir = "/"};
    if (auto res = nspawn(runner_, opts, {"/usr/bin/apt-get", "-y", "update"}); !res)
        return std::unexpected(res.error());
    opts.env = NONINTERACTIVE;
    if (auto res = nspawn(runner_, opts, {"/usr/bin/apt-get", "-y", "dist-upgrade"}); !res)
        return std::unexpected(res.error());

    auto l2s = store_.list(Tier::L2);
    if (!l2s)
        return std::unexpected(l2s.error());
    if (!l2s->empty()) {
        console_.info("[L1] {} cached dependency layer(s) were built on the previous base system and may be stale",
                      l2s->size());
    }
    return {};
}

Result<void> CacheManager::prepare_l1(BuildSession &session, SessionResources &res) {
    auto l1 = store_.probe(Tier::L1, session.codename);
    if (!l1)
        return std::unexpected(l1.error());

    if (l1->state == LayerState::Absent) {
        auto exclusive = LayerLock::acquire(store_.root(), Tier::L1, session.codename, LockMode::Exclusive);
        if (!exclusive)
            return std::unexpected(exclusive.error());
        // another session may have created it while we waited
        auto again = store_.probe(Tier::L1, session.codename);
        if (!again)
            return std::unexpected(again.error());
        if (again->state == LayerState::Absent) {
            if (auto created = bootstrap(session.codename); !created)
                return std::unexpected(created.error());
        }
    }

    auto shared = LayerLock::acquire(store_.root(), Tier::L1, session.codename, LockMode::Shared);
    if (!shared)
        return std::unexpected(shared.error());
    res.l1_lock = std::move(*shared);

    l1 = store_.probe(Tier::L1, session.codename);
    if (!l1)
        return std::unexpected(l1.error());
    if (l1->state == LayerState::Absent)
        return fail(ErrorKind::LayerMissing, "base filesystem (L1) for {} vanished", session.codename);

    l1->state = LayerState::Ready;
    session.l1 = *l1;
    advance(session, SessionState::L1Ready);
    console_.info("[L1] Ready");
    return {};
}

// ---------------------------------------------------------------------------
// L2

Result<void> CacheManager::resolve_deps(BuildSession &session) {
    auto resolution = compute_fingerprint(runner_, session.l1->paths.content, session.source_dir, session.machine);
    if (!resolution)
        return std::unexpected(resolution.error());
    session.resolution = std::move(*resolution);
    console_.debug("[L2] Fingerprint {} for {} dependencies", session.resolution.fingerprint,
                   session.resolution.deps.size());
    advance(session, SessionState::NeedL2);
    return {};
}

Result<void> CacheManager::populate_l2(BuildSession &session, Layer &l2) {
    auto created = store_.create_layer_dirs(Tier::L2, session.resolution.fingerprint);
    if (!created)
        return std::unexpected(created.error());
    l2 = *created;
    console_.info("[L2] Creating {}", l2.paths.content.string());

    Result<void> outcome;
    {
        MountStack creation(mounter_, console_);
        auto install = [&]() -> Result<void> {
            if (auto res = creation.push(session.l1->paths.content, l2.paths.content, l2.paths.work, l2.paths.mount);
                !res)
                return res;

            std::string deps_list;
            for (const auto &dep : session.resolution.deps)
                deps_list += std::format(" {}:{}", dep.name, dep.version);
            console_.info("[L2] Installing dependencies...");
            if (console_.verbosity() == 0)
                console_.info("[L2]{}", deps_list);

            NamespaceOptions opts = namespace_for(session, l2);
            opts.env = NONINTERACTIVE;
            opts.overlays = {{session.source_dir, CONTAINER_SRC_DIR}};
            if (auto res = nspawn(runner_, opts, {"/usr/bin/apt-get", "build-dep", "-y", "."},
                                  /*quiet=*/console_.verbosity() == 0);
                !res)
                return std::unexpected(res.error());

            if (auto res = LayerStore::write_manifest(l2.paths.mount, session.resolution.deps); !res)
                return res;

            if (auto res = nspawn(runner_, namespace_for(session, l2), {"/usr/bin/apt-get", "clean"}, true); !res)
                return std::unexpected(res.error());
            return {};
        };
        outcome = install();
        if (auto released = creation.release_all(); !released && outcome)
            outcome = released;
    }

    if (!outcome) {
        if (auto cleanup = store_.remove_layer(Tier::L2, l2.id); !cleanup)
            console_.error("Cannot remove incomplete dependency layer: {}", cleanup.error());
        return outcome;
    }
    l2.state = LayerState::Ready;
    return {};
}

Result<void> CacheManager::prepare_l2(BuildSession &session, SessionResources &res) {
    const auto &fingerprint = session.resolution.fingerprint;
    auto lock = LayerLock::acquire(store_.root(), Tier::L2, fingerprint, LockMode::Exclusive);
    if (!lock)
        return std::unexpected(lock.error());
    res.l2_lock = std::move(*lock);

    // with the L2 lock held, anything still mounted for this fingerprint belongs to a dead session
    if (auto released = release_orphaned_mounts(mounter_, store_, fingerprint, console_); !released)
        return released;

    auto l2 = store_.probe(Tier::L2, fingerprint);
    if (!l2)
        return std::unexpected(l2.error());

    switch (l2->state) {
    case LayerState::Ready:
        session.l2_cache_hit = true;
        console_.debug("[L2] Reusing {}", l2->paths.content.string());
        if (auto touched = store_.touch(Tier::L2, fingerprint); !touched)
            console_.error("{}", touched.error());
        break;
    case LayerState::Mounted:
        return fail(ErrorKind::MountVerificationFailure, "{} is still mounted from an earlier session",
                    l2->paths.mount.string());
    case LayerState::Stale:
        console_.info("[L2] Removing incomplete {}", l2->paths.content.string());
        if (auto removed = store_.remove_layer(Tier::L2, fingerprint); !removed)
            return removed;
        [[fallthrough]];
    case LayerState::Absent:
    case LayerState::Creating:
        if (auto created = populate_l2(session, *l2); !created)
            return created;
        break;
    }

    session.l2 = *l2;
    if (auto mounted = res.mounts.push(session.l1->paths.content, l2->paths.content, l2->paths.work,
                                       l2->paths.mount);
        !mounted)
        return mounted;
    session.l2->state = LayerState::Mounted;
    advance(session, SessionState::L2Ready);
    console_.info("[L2] Ready");
    return {};
}

// ---------------------------------------------------------------------------
// L3

Result<Layer> CacheManager::fresh_layer(Tier tier, const std::string &id) {
    auto layer = store_.probe(tier, id);
    if (!layer)
        return layer;
    if (layer->state == LayerState::Mounted) {
        return fail(ErrorKind::MountVerificationFailure, "{} is still mounted from an earlier session",
                    layer->paths.mount.string());
    }
    if (layer->state != LayerState::Absent) {
        console_.debug("[{}] Removing leftovers in {}", tier_name(tier), layer->paths.content.string());
        if (auto removed = store_.remove_layer(tier, id); !removed)
            return std::unexpected(removed.error());
    }
    console_.info("[{}] Creating {}", tier_name(tier), layer->paths.content.string());
    return store_.create_layer_dirs(tier, id);
}

Result<void> CacheManager::run_build(BuildSession &session, SessionResources &res) {
    if (auto step = prepare_l1(session, res); !step)
        return step;
    if (auto step = resolve_deps(session); !step)
        return step;
    if (auto step = prepare_l2(session, res); !step)
        return step;

    const auto &fingerprint = session.resolution.fingerprint;
    auto lock = LayerLock::acquire(store_.root(), Tier::L3, fingerprint, LockMode::Exclusive);
    if (!lock)
        return std::unexpected(lock.error());
    res.top_lock = std::move(*lock);

    auto l3 = fresh_layer(Tier::L3, fingerprint);
    if (!l3)
        return std::unexpected(l3.error());
    session.l3 = *l3;
    advance(session, SessionState::NeedL3);

    if (auto mounted = res.mounts.push(session.l2->paths.mount, l3->paths.content, l3->paths.work, l3->paths.mount);
        !mounted)
        return mounted;
    session.l3->state = LayerState::Mounted;

    if (auto copied = copy_into(session.source_dir / ".", l3->paths.mount / "srv"); !copied)
        return copied;

    NamespaceOptions opts = namespace_for(session, *l3);
    opts.private_network = config_.private_network;
    opts.drop_capability = config_.drop_capability;
    opts.system_call_filter = config_.system_call_filter;
    std::vector<std::string> inner = {"/usr/bin/dpkg-buildpackage"};
    inner.insert(inner.end(), session.extra_args.begin(), session.extra_args.end());
    if (auto built = nspawn(runner_, opts, inner); !built)
        return std::unexpected(built.error());
    advance(session, SessionState::L3Ready);

    // artifacts are read from the upper dir, so unmount first
    if (auto released = res.mounts.release_all(); !released)
        return released;
    session.l2->state = LayerState::Ready;
    session.l3->state = LayerState::Ready;
    session.success = true;

    auto artifacts = export_artifacts(session);
    if (!artifacts)
        return std::unexpected(artifacts.error());
    session.artifacts = std::move(*artifacts);
    advance(session, SessionState::Done);
    return {};
}

Result<std::vector<std::filesystem::path>> CacheManager::export_artifacts(const BuildSession &session) {
    std::vector<std::filesystem::path> exported;
    const auto &l3_dir = session.l3->paths.content;
    if (config_.export_dir.empty()) {
        console_.success("\n[Success] Output is at {}", l3_dir.string());
        return exported;
    }

    std::filesystem::path dest = config_.export_dir;
    if (dest.is_relative())
        dest = session.source_dir / dest;
    dest = dest.lexically_normal();

    std::error_code ec;
    std::filesystem::create_directories(dest, ec);
    if (ec)
        return fail(ErrorKind::IoFailure, "Cannot create export dir {}: {}", dest.string(), ec.message());

    // staged inside dest so the renames below stay on one filesystem
    const auto staging = dest / std::format(".strata-export-{}", getpid());
    std::filesystem::remove_all(staging, ec);
    if (!ec)
        std::filesystem::create_directory(staging, ec);
    if (ec)
        return fail(ErrorKind::IoFailure, "Cannot create {}: {}", staging.string(), ec.message());

    auto discard_staging = [&] {
        std::error_code rm_ec;
        std::filesystem::remove_all(staging, rm_ec);
        if (rm_ec)
            console_.error("Cannot remove {}: {}", staging.string(), rm_ec.message());
    };

    auto names = stage_artifacts(l3_dir, staging);
    if (!names) {
        discard_staging();
        return std::unexpected(names.error());
    }

    for (const auto &name : *names) {
        auto target = dest / name;
        std::filesystem::rename(staging / name, target, ec);
        if (ec) {
            Error err{ErrorKind::IoFailure, std::format("Cannot export {}: {}", target.string(), ec.message())};
            for (const auto &done : exported) {
                std::error_code rm_ec;
                std::filesystem::remove(done, rm_ec);
                if (rm_ec)
                    err.message += std::format("; cannot withdraw {}: {}", done.string(), rm_ec.message());
            }
            discard_staging();
            return std::unexpected(err);
        }
        console_.debug("Exported {}", target.string());
        exported.push_back(std::move(target));
    }
    discard_staging();

    std::sort(exported.begin(), exported.end());
    console_.success("\n[Success] {} file(s) exported to {}", exported.size(), dest.string());
    return exported;
}

Result<BuildSession> CacheManager::build(const BuildRequest &req) {
    BuildSession session = new_session(req);
    Result<void> outcome;
    {
        SessionResources res{.mounts = MountStack(mounter_, console_)};
        outcome = run_build(session, res);
        if (!outcome) {
            if (auto released = res.mounts.release_all(); !released)
                console_.error("{}", released.error());
        }
    }
    if (!outcome) {
        console_.debug("[session] failed in {}", to_string(session.state));
        session.state = SessionState::Failed;
        return std::unexpected(outcome.error());
    }
    return session;
}

// ---------------------------------------------------------------------------
// install

Result<int> CacheManager::run_install(BuildSession &session, SessionResources &res,
                                      const std::vector<std::filesystem::path> &packages) {
    if (auto step = prepare_l1(session, res); !step)
        return std::unexpected(step.error());
    if (auto step = resolve_deps(session); !step)
        return std::unexpected(step.error());
    if (auto step = prepare_l2(session, res); !step)
        return std::unexpected(step.error());

    const auto &fingerprint = session.resolution.fingerprint;
    auto lock = LayerLock::acquire(store_.root(), Tier::L2i, fingerprint, LockMode::Exclusive);
    if (!lock)
        return std::unexpected(lock.error());
    res.top_lock = std::move(*lock);

    auto l2i = fresh_layer(Tier::L2i, fingerprint);
    if (!l2i)
        return std::unexpected(l2i.error());
    if (auto mounted = res.mounts.push(session.l2->paths.mount, l2i->paths.content, l2i->paths.work,
                                       l2i->paths.mount);
        !mounted)
        return std::unexpected(mounted.error());

    std::vector<std::string> inner = {"/usr/bin/apt-get", "install", "-y"};
    for (const auto &package : packages) {
        if (auto copied = copy_into(package, l2i->paths.mount / "srv"); !copied)
            return std::unexpected(copied.error());
        inner.push_back(std::format("{}/{}", CONTAINER_SRC_DIR, package.filename().string()));
    }

    NamespaceOptions opts = namespace_for(session, *l2i);
    opts.env = NONINTERACTIVE;
    auto installed = nspawn(runner_, opts, inner, /*quiet=*/false, /*checked=*/false);
    if (!installed)
        return std::unexpected(installed.error());

    if (auto released = res.mounts.release_all(); !released)
        return std::unexpected(released.error());
    if (auto removed = store_.remove_layer(Tier::L2i, fingerprint); !removed)
        return std::unexpected(removed.error());
    return installed->status;
}

Result<int> CacheManager::install(const BuildRequest &req, const std::vector<std::filesystem::path> &packages) {
    if (packages.empty())
        return fail(ErrorKind::InvalidArgument, "install needs at least one package file");
    std::error_code ec;
    for (const auto &package : packages) {
        if (!std::filesystem::is_regular_file(package, ec))
            return fail(ErrorKind::InvalidArgument, "{} is not a package file", package.string());
    }

    BuildSession session = new_session(req);
    Result<int> outcome;
    {
        SessionResources res{.mounts = MountStack(mounter_, console_)};
        outcome = run_install(session, res, packages);
        if (!outcome) {
            if (auto released = res.mounts.release_all(); !released)
                console_.error("{}", released.error());
        }
    }
    return outcome;
}

// ---------------------------------------------------------------------------
// purge / show

Result<EvictionReport> CacheManager::purge() {
    auto report = evict_l2_layers(store_, mounter_, config_.eviction, console_);
    if (!report)
        return report;
    console_.info("Purged {} layer(s), {} in use", report->removed.size(), report->skipped_in_use.size());
    return report;
}

Result<void> CacheManager::show() {
    console_.info("Mounted overlays:");
    std::ifstream table("/proc/self/mounts");
    for (const auto &mount_point : overlay_mounts_under(table, store_.root()))
        console_.info("  {}", mount_point);

    console_.info("Running containers:");
    auto machines = runner_.run({.args = {"machinectl", "list", "--no-legend"}, .quiet = true, .quiet_cmd = true});
    if (!machines) {
        console_.debug("{}", machines.error());
    } else {
        for (const auto &line : machines->lines) {
            if (line.starts_with("strata"))
                console_.info("  {}", line);
        }
    }

    console_.info("Layers:");
    for (Tier tier : {Tier::L1, Tier::L2, Tier::L3}) {
        console_.info("  {}:", tier_name(tier));
        auto layers = store_.list(tier);
        if (!layers)
            return std::unexpected(layers.error());

        for (const auto &layer : *layers) {
            std::string size = "?";
            auto du = runner_.run_checked({.args = {"du", "-hs", layer.content.string()},
                                           .privileged = true,
                                           .quiet = true,
                                           .quiet_cmd = true});
            if (!du) {
                console_.debug("{}", du.error());
            } else if (!du->lines.empty()) {
                size = du->lines.front().substr(0, du->lines.front().find('\t'));
            }
            console_.info("    {:35} {:>8} {:6.1f} days", layer.id, size, layer.age_days);

            if (tier != Tier::L2)
                continue;
            auto deps = LayerStore::read_manifest(layer.content);
            if (!deps) {
                console_.info("      ({})", deps.error().message);
                continue;
            }
            for (const auto &dep : *deps)
                console_.info("      {}:{}", dep.name, dep.version);
            console_.info("");
        }
        console_.info("");
    }
    return {};
}

} // namespace strata
