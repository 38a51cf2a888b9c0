#include "fake_runner.hpp"
#include "strata/eviction.hpp"
#include "strata/layer_lock.hpp"

#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>

using namespace strata;
using strata::testing::FakeRunner;
using strata::testing::TempDir;

using Ids = std::vector<std::string>;

TEST(SelectForEviction, RemovesLayersPastMaxAge) {
    std::vector<EvictionCandidate> layers = {{"a", 5}, {"b", 40}, {"c", 2}, {"d", 35}};
    EXPECT_EQ(select_for_eviction(layers, {.max_age_days = 30, .max_count = 10}), (Ids{"b", "d"}));
}

TEST(SelectForEviction, AgeEqualToLimitIsKept) {
    std::vector<EvictionCandidate> layers = {{"a", 30}, {"b", 30.5}};
    EXPECT_EQ(select_for_eviction(layers, {.max_age_days = 30, .max_count = 10}), (Ids{"b"}));
}

TEST(SelectForEviction, TrimsOldestDownToMaxCount) {
    std::vector<EvictionCandidate> layers = {{"a", 1}, {"b", 4}, {"c", 2}, {"d", 3}, {"e", 0.5}};
    EXPECT_EQ(select_for_eviction(layers, {.max_age_days = 30, .max_count = 3}), (Ids{"b", "d"}));
}

TEST(SelectForEviction, AgeAndCountCombine) {
    std::vector<EvictionCandidate> layers = {{"a", 1}, {"b", 50}, {"c", 2}, {"d", 3}};
    EXPECT_EQ(select_for_eviction(layers, {.max_age_days = 30, .max_count = 2}), (Ids{"b", "d"}));
}

TEST(SelectForEviction, InUseLayersAreKeptButCounted) {
    std::vector<EvictionCandidate> layers = {{"a", 1}, {"b", 50, true}, {"c", 2}, {"d", 3}};
    // b is too old but busy; it still occupies one of the two slots
    EXPECT_EQ(select_for_eviction(layers, {.max_age_days = 30, .max_count = 2}), (Ids{"d", "c"}));
}

TEST(SelectForEviction, NothingToDo) {
    EXPECT_TRUE(select_for_eviction({}, {}).empty());
    std::vector<EvictionCandidate> layers = {{"a", 1}, {"b", 2}};
    EXPECT_TRUE(select_for_eviction(layers, {.max_age_days = 30, .max_count = 10}).empty());
}

TEST(SelectForEviction, ZeroCountRemovesEverythingIdle) {
    std::vector<EvictionCandidate> layers = {{"a", 1}, {"b", 2, true}, {"c", 3}};
    EXPECT_EQ(select_for_eviction(layers, {.max_age_days = 30, .max_count = 0}), (Ids{"c", "a"}));
}

class EvictL2Layers : public ::testing::Test {
protected:
    void add_layer(const std::string &id, int age_days) {
        ASSERT_TRUE(store.create_layer_dirs(Tier::L2, id));
        ASSERT_TRUE(LayerStore::write_manifest(store.paths_for(Tier::L2, id).content, {{"libfoo", "1.0"}}));
        ASSERT_TRUE(store.create_layer_dirs(Tier::L3, id));
        std::filesystem::last_write_time(store.paths_for(Tier::L2, id).content,
                                         std::filesystem::file_time_type::clock::now() -
                                             std::chrono::hours(24 * age_days));
    }

    bool present(Tier tier, const std::string &id) {
        return store.probe(tier, id)->state != LayerState::Absent;
    }

    TempDir tmp;
    FakeRunner runner;
    OverlayMounter mounter{runner};
    LayerStore store{tmp.path(), runner};
    Console console{ConsoleStyle{.color = false}, 0, nullptr, nullptr};
};

TEST_F(EvictL2Layers, RemovesOldLayersWithTheirWorkspace) {
    add_layer("aaaa", 5);
    add_layer("bbbb", 40);
    add_layer("cccc", 2);
    add_layer("dddd", 35);

    auto report = evict_l2_layers(store, mounter, {.max_age_days = 30, .max_count = 10}, console);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report->removed, (Ids{"bbbb", "dddd"}));
    EXPECT_TRUE(report->skipped_in_use.empty());

    EXPECT_TRUE(present(Tier::L2, "aaaa"));
    EXPECT_TRUE(present(Tier::L2, "cccc"));
    EXPECT_FALSE(present(Tier::L2, "bbbb"));
    EXPECT_FALSE(present(Tier::L3, "bbbb"));
    EXPECT_FALSE(present(Tier::L2, "dddd"));
    EXPECT_FALSE(present(Tier::L3, "dddd"));
}

TEST_F(EvictL2Layers, LockedLayerIsSkipped) {
    add_layer("aaaa", 40);
    add_layer("bbbb", 45);

    auto busy = LayerLock::acquire(store.root(), Tier::L2, "bbbb", LockMode::Exclusive);
    ASSERT_TRUE(busy);

    auto report = evict_l2_layers(store, mounter, {.max_age_days = 30, .max_count = 10}, console);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report->removed, (Ids{"aaaa"}));
    EXPECT_EQ(report->skipped_in_use, (Ids{"bbbb"}));
    EXPECT_TRUE(present(Tier::L2, "bbbb"));
}

TEST_F(EvictL2Layers, LeftoverMountOfUnlockedLayerIsReleasedAndEvicted) {
    add_layer("aaaa", 40);
    const auto l2_mount = store.paths_for(Tier::L2, "aaaa").mount;
    const auto l3_mount = store.paths_for(Tier::L3, "aaaa").mount;
    std::filesystem::create_directories(l2_mount / "usr");
    std::filesystem::create_directories(l3_mount / "srv");

    auto report = evict_l2_layers(store, mounter, {.max_age_days = 30, .max_count = 0}, console);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report->removed, (Ids{"aaaa"}));
    EXPECT_TRUE(report->skipped_in_use.empty());
    EXPECT_EQ(runner.mount_log, (Ids{"umount " + l3_mount.string(), "umount " + l2_mount.string()}));
    EXPECT_FALSE(present(Tier::L2, "aaaa"));
    EXPECT_FALSE(present(Tier::L3, "aaaa"));
}

TEST_F(EvictL2Layers, LeftoverMountThatCannotBeReleasedStopsPurge) {
    add_layer("aaaa", 40);
    std::filesystem::create_directories(store.paths_for(Tier::L2, "aaaa").mount / "usr");
    runner.fail_on = "umount";

    auto report = evict_l2_layers(store, mounter, {.max_age_days = 30, .max_count = 0}, console);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind, ErrorKind::ExternalCommandFailure);
    EXPECT_EQ(runner.count("rm -rf"), 0);
    EXPECT_TRUE(present(Tier::L2, "aaaa"));
}

TEST_F(EvictL2Layers, RemovalFailureIsReported) {
    add_layer("aaaa", 40);
    runner.fail_on = "rm -rf";

    auto report = evict_l2_layers(store, mounter, {.max_age_days = 30, .max_count = 10}, console);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind, ErrorKind::ExternalCommandFailure);
}
