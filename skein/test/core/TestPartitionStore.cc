//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include "gtest/gtest.h"
#include <PartitionStore.h>
#include <algorithm>
#include "TestKernels.h"

using namespace skein;

static MaterializedPartition materialized(PartitionID id, const std::vector<int64_t>& v) {
    return MaterializedPartition(id, makePartition(v));
}

TEST(PartitionStore, Lifecycle) {
    PartitionStore store;
    store.add(0, 10, 0);
    EXPECT_TRUE(store.contains(0));
    EXPECT_FALSE(store.contains(1));
    EXPECT_EQ(store.state(0), PartitionState::PENDING);
    EXPECT_EQ(store.get(0).producer, 10);
    EXPECT_THROW(store.add(0, 11, 0), std::logic_error);
    EXPECT_THROW(store.get(42), std::out_of_range);

    store.markMaterializing(0);
    EXPECT_EQ(store.state(0), PartitionState::MATERIALIZING);

    store.addConsumer(0);
    EXPECT_TRUE(store.markMaterialized(materialized(0, {1, 2, 3})));
    EXPECT_EQ(store.state(0), PartitionState::MATERIALIZED);
    EXPECT_EQ(store.get(0).numRows.value(), 3);
    EXPECT_EQ(store.get(0).numBytes.value(), 3 * sizeof(int64_t));
    EXPECT_EQ(store.numHeld(), 1);
}

TEST(PartitionStore, MaterializedDataNeverMutates) {
    PartitionStore store;
    store.add(0, 1, 0);
    store.addConsumer(0);
    ASSERT_TRUE(store.markMaterialized(materialized(0, {1, 2, 3})));
    auto first = store.get(0).data;

    // a second writer (e.g. a late duplicate attempt) is ignored
    EXPECT_FALSE(store.markMaterialized(materialized(0, {4, 5})));
    EXPECT_EQ(store.get(0).data, first);
    EXPECT_EQ(values(store.get(0).data), std::vector<int64_t>({1, 2, 3}));
}

TEST(PartitionStore, GarbageCollection) {
    PartitionStore store;
    store.add(0, 1, 0);
    store.add(1, 1, 1);
    store.addConsumer(0, 2);
    store.pin(1);

    store.markMaterialized(materialized(0, {1}));
    store.markMaterialized(materialized(1, {2}));

    // consumers and pins keep partitions alive
    EXPECT_TRUE(store.collectGarbage().empty());
    EXPECT_TRUE(store.needed(0));

    store.releaseConsumer(0);
    EXPECT_TRUE(store.collectGarbage().empty());
    store.releaseConsumer(0);
    EXPECT_FALSE(store.needed(0));
    EXPECT_EQ(store.collectGarbage(), std::vector<PartitionID>({0}));
    EXPECT_EQ(store.state(0), PartitionState::RELEASED);
    EXPECT_EQ(store.get(0).data, nullptr);

    store.unpin(1);
    EXPECT_EQ(store.collectGarbage(), std::vector<PartitionID>({1}));
    EXPECT_EQ(store.numHeld(), 0);

    EXPECT_THROW(store.releaseConsumer(0), std::logic_error);
    EXPECT_THROW(store.unpin(1), std::logic_error);
}

TEST(PartitionStore, GarbageIsRecheckedOnCollection) {
    PartitionStore store;
    store.add(0, 1, 0);
    store.addConsumer(0);
    store.markMaterialized(materialized(0, {1}));
    store.releaseConsumer(0);

    // a recompute registered a new consumer before the collection ran
    store.addConsumer(0);
    EXPECT_TRUE(store.collectGarbage().empty());
    EXPECT_EQ(store.state(0), PartitionState::MATERIALIZED);
}

TEST(PartitionStore, LostAndRecomputed) {
    PartitionStore store;
    store.add(0, 1, 0);
    store.addConsumer(0);

    // only materialized partitions can get lost
    EXPECT_FALSE(store.markLost(0));

    MaterializedPartition remote;
    remote.id = 0;
    remote.location = "worker-1";
    remote.numRows = 10;
    store.markMaterialized(remote);
    EXPECT_EQ(store.onLocation("worker-1"), std::vector<PartitionID>({0}));
    EXPECT_EQ(store.numHeld(), 1);

    EXPECT_TRUE(store.markLost(0));
    EXPECT_FALSE(store.markLost(0));
    EXPECT_EQ(store.state(0), PartitionState::LOST);
    EXPECT_TRUE(store.get(0).location.empty());
    EXPECT_TRUE(store.onLocation("worker-1").empty());

    store.markPending(0);
    EXPECT_EQ(store.state(0), PartitionState::PENDING);
    EXPECT_TRUE(store.markMaterialized(materialized(0, {7})));
    EXPECT_EQ(store.count(PartitionState::MATERIALIZED), 1);
}

TEST(PartitionStore, ReleaseAll) {
    PartitionStore store;
    for(PartitionID i = 0; i < 4; ++i) {
        store.add(i, 1, static_cast<size_t>(i));
        store.addConsumer(i);
    }
    store.markMaterialized(materialized(0, {1}));
    store.markMaterialized(materialized(2, {3}));

    auto released = store.releaseAll();
    std::sort(released.begin(), released.end());
    EXPECT_EQ(released, std::vector<PartitionID>({0, 2}));
    EXPECT_EQ(store.count(PartitionState::RELEASED), 4);
    EXPECT_EQ(store.numHeld(), 0);
    EXPECT_FALSE(store.needed(1));
}
