#pragma once

#include "strata/config.hpp"
#include "strata/console.hpp"
#include "strata/layer_store.hpp"
#include "strata/mount.hpp"
#include "strata/utility.hpp"

#include <string>
#include <vector>

namespace strata {

struct EvictionCandidate {
    std::string id;
    double age_days = 0;
    bool in_use = false; ///< locked by a live session: never selected
};

/**
 * @brief Chooses which L2 layers to delete.
 *
 * Every layer older than `max_age_days` goes; if more than `max_count`
 * remain, the oldest of the rest go until the count is at the limit. Layers
 * in use are never chosen but still count toward the limit.
 *
 * @return Identifiers to delete, oldest first.
 */
std::vector<std::string> select_for_eviction(std::vector<EvictionCandidate> candidates, const EvictionPolicy &policy);

struct EvictionReport {
    std::vector<std::string> removed;
    std::vector<std::string> skipped_in_use;
};

/**
 * @brief Applies the eviction policy to the persisted L2 layers.
 *
 * Each L2 is try-locked exclusively while the decision is made and the
 * deletion runs, so a build cannot pick it up half-deleted. A layer whose
 * lock is held elsewhere is in use; mounts found on a layer whose lock was
 * granted were left by a dead session and are released before deletion. The
 * L3 slot of an evicted fingerprint is removed with it.
 */
Result<EvictionReport> evict_l2_layers(LayerStore &store, OverlayMounter &mounter, const EvictionPolicy &policy,
                                       Console &console);

} // namespace strata
