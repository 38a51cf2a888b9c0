#include "strata/eviction.hpp"

#include "strata/layer_lock.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>

namespace strata {

std::vector<std::string> select_for_eviction(std::vector<EvictionCandidate> candidates, const EvictionPolicy &policy) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const EvictionCandidate &a, const EvictionCandidate &b) { return a.age_days > b.age_days; });

    std::vector<std::string> selected;
    std::vector<bool> chosen(candidates.size(), false);
    size_t remaining = candidates.size();

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!candidates[i].in_use && candidates[i].age_days > policy.max_age_days) {
            chosen[i] = true;
            --remaining;
        }
    }

    for (size_t i = 0; i < candidates.size() && remaining > policy.max_count; ++i) {
        if (chosen[i] || candidates[i].in_use)
            continue;
        chosen[i] = true;
        --remaining;
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (chosen[i])
            selected.push_back(candidates[i].id);
    }
    return selected;
}

Result<EvictionReport> evict_l2_layers(LayerStore &store, OverlayMounter &mounter, const EvictionPolicy &policy,
                                       Console &console) {
    auto layers = store.list(Tier::L2);
    if (!layers)
        return std::unexpected(layers.error());

    EvictionReport report;
    std::vector<EvictionCandidate> candidates;
    std::unordered_map<std::string, LayerLock> held;

    for (const auto &info : *layers) {
        auto lock = LayerLock::try_acquire(store.root(), Tier::L2, info.id, LockMode::Exclusive);
        if (!lock)
            return std::unexpected(lock.error());

        bool in_use = !lock->has_value();
        if (in_use) {
            console.debug("[L2] {} is in use, keeping it", info.id);
            report.skipped_in_use.push_back(info.id);
        } else {
            held.emplace(info.id, std::move(**lock));
        }
        candidates.push_back({.id = info.id, .age_days = info.age_days, .in_use = in_use});
    }

    for (const auto &id : select_for_eviction(std::move(candidates), policy)) {
        console.info("[L2] Purging {}", id);
        if (auto res = release_orphaned_mounts(mounter, store, id, console); !res)
            return std::unexpected(res.error());
        if (auto res = store.remove_layer(Tier::L2, id); !res)
            return std::unexpected(res.error());
        if (auto res = store.remove_layer(Tier::L3, id); !res)
            return std::unexpected(res.error());
        report.removed.push_back(id);
    }
    return report;
}

} // namespace strata
