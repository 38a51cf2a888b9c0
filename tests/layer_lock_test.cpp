#include "fake_runner.hpp"
#include "strata/layer_lock.hpp"

#include <gtest/gtest.h>

using namespace strata;
using strata::testing::TempDir;

TEST(LayerLock, CreatesLockFileUnderCacheRoot) {
    TempDir tmp;
    auto lock = LayerLock::acquire(tmp.path(), Tier::L2, "284ba56263", LockMode::Exclusive);
    ASSERT_TRUE(lock) << lock.error().message;
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "locks" / "l2_284ba56263.lock"));
    EXPECT_EQ(lock->mode(), LockMode::Exclusive);
}

TEST(LayerLock, ExclusiveExcludesEveryoneElse) {
    TempDir tmp;
    auto held = LayerLock::acquire(tmp.path(), Tier::L2, "abc", LockMode::Exclusive);
    ASSERT_TRUE(held);

    auto other = LayerLock::try_acquire(tmp.path(), Tier::L2, "abc", LockMode::Exclusive);
    ASSERT_TRUE(other) << other.error().message;
    EXPECT_FALSE(other->has_value());

    auto reader = LayerLock::try_acquire(tmp.path(), Tier::L2, "abc", LockMode::Shared);
    ASSERT_TRUE(reader);
    EXPECT_FALSE(reader->has_value());
}

TEST(LayerLock, SharedHoldersCoexist) {
    TempDir tmp;
    auto first = LayerLock::acquire(tmp.path(), Tier::L1, "sid", LockMode::Shared);
    ASSERT_TRUE(first);

    auto second = LayerLock::try_acquire(tmp.path(), Tier::L1, "sid", LockMode::Shared);
    ASSERT_TRUE(second);
    EXPECT_TRUE(second->has_value());

    auto writer = LayerLock::try_acquire(tmp.path(), Tier::L1, "sid", LockMode::Exclusive);
    ASSERT_TRUE(writer);
    EXPECT_FALSE(writer->has_value());
}

TEST(LayerLock, DifferentLayersAreIndependent) {
    TempDir tmp;
    auto l2 = LayerLock::acquire(tmp.path(), Tier::L2, "abc", LockMode::Exclusive);
    ASSERT_TRUE(l2);

    auto l3 = LayerLock::try_acquire(tmp.path(), Tier::L3, "abc", LockMode::Exclusive);
    ASSERT_TRUE(l3);
    EXPECT_TRUE(l3->has_value());

    auto other = LayerLock::try_acquire(tmp.path(), Tier::L2, "def", LockMode::Exclusive);
    ASSERT_TRUE(other);
    EXPECT_TRUE(other->has_value());
}

TEST(LayerLock, ReleasedOnDestructionAndFollowsMoves) {
    TempDir tmp;
    {
        auto held = LayerLock::acquire(tmp.path(), Tier::L2, "abc", LockMode::Exclusive);
        ASSERT_TRUE(held);
        LayerLock moved = std::move(*held);

        auto probe = LayerLock::try_acquire(tmp.path(), Tier::L2, "abc", LockMode::Exclusive);
        ASSERT_TRUE(probe);
        EXPECT_FALSE(probe->has_value());
    }

    auto again = LayerLock::try_acquire(tmp.path(), Tier::L2, "abc", LockMode::Exclusive);
    ASSERT_TRUE(again);
    EXPECT_TRUE(again->has_value());
}

TEST(LayerLock, RejectsInvalidIdentifier) {
    TempDir tmp;
    auto lock = LayerLock::acquire(tmp.path(), Tier::L2, "../x", LockMode::Shared);
    ASSERT_FALSE(lock);
    EXPECT_EQ(lock.error().kind, ErrorKind::InvalidArgument);
}
