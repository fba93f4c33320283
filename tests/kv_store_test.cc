/*
 * ShardKV
 *
 * Copyright 2017 Operating Systems Laboratory EPFL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "kvstore/kv_store.h"
#include "common/types.h"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace skv;

TEST(KVStoreTest, MissingKeyReadsEmpty) {
    KVStore store;

    EXPECT_EQ("", store.Get("nothing"));
    EXPECT_EQ(0, store.Size());
}

TEST(KVStoreTest, PutOverwritesAndCachesNoReply) {
    KVStore store;
    OpOutcome outcome;

    ASSERT_TRUE(store.Apply(OpType::Put, "k", "v1", 7, 1, outcome));
    EXPECT_FALSE(outcome.HasReply);
    EXPECT_EQ("v1", outcome.NewValue);

    ASSERT_TRUE(store.Apply(OpType::Put, "k", "v2", 7, 2, outcome));
    EXPECT_EQ("v2", store.Get("k"));
    EXPECT_EQ(1, store.Size());
    EXPECT_EQ(1, store.NumClients());
}

TEST(KVStoreTest, AppendReturnsPreviousValue) {
    KVStore store;
    OpOutcome outcome;

    ASSERT_TRUE(store.Apply(OpType::Append, "k", "a", 7, 1, outcome));
    EXPECT_TRUE(outcome.HasReply);
    EXPECT_EQ("", outcome.Reply);
    EXPECT_EQ("a", outcome.NewValue);

    ASSERT_TRUE(store.Apply(OpType::Append, "k", "b", 7, 2, outcome));
    EXPECT_EQ("a", outcome.Reply);
    EXPECT_EQ("ab", outcome.NewValue);
    EXPECT_EQ("ab", store.Get("k"));
}

TEST(KVStoreTest, RetriedAppendIsAppliedOnce) {
    KVStore store;
    OpOutcome first;
    OpOutcome retry;

    ASSERT_TRUE(store.Apply(OpType::Put, "k", "a", 7, 1, first));
    ASSERT_TRUE(store.Apply(OpType::Append, "k", "b", 7, 2, first));

    EXPECT_FALSE(store.Apply(OpType::Append, "k", "b", 7, 2, retry));
    EXPECT_TRUE(retry.HasReply);
    EXPECT_EQ("a", retry.Reply);
    EXPECT_EQ("ab", store.Get("k"));
}

TEST(KVStoreTest, StaleSequenceIsIgnored) {
    KVStore store;
    OpOutcome outcome;

    ASSERT_TRUE(store.Apply(OpType::Put, "k", "new", 7, 5, outcome));
    EXPECT_FALSE(store.Apply(OpType::Put, "k", "old", 7, 3, outcome));
    EXPECT_EQ("new", store.Get("k"));
}

TEST(KVStoreTest, ClientsAreDeduplicatedIndependently) {
    KVStore store;
    OpOutcome outcome;

    ASSERT_TRUE(store.Apply(OpType::Append, "k", "x", 1, 1, outcome));
    ASSERT_TRUE(store.Apply(OpType::Append, "k", "y", 2, 1, outcome));
    EXPECT_EQ("xy", store.Get("k"));
    EXPECT_EQ(2, store.NumClients());
}

TEST(KVStoreTest, ReplicatedUpdateStoresPrecomputedValue) {
    KVStore store;
    ReplicatedUpdate update;
    update.Key = "k";
    update.NewValue = "ab";
    update.ClientId = 7;
    update.Seq = 2;
    update.HasReply = true;
    update.Reply = "a";
    update.Op = OpType::Append;

    // the backup never saw "a", it takes the primary's value as is
    ASSERT_TRUE(store.ApplyReplicated(update));
    EXPECT_EQ("ab", store.Get("k"));

    EXPECT_FALSE(store.ApplyReplicated(update));

    // a client retry reaching the backup gets the primary's reply back
    OpOutcome outcome;
    EXPECT_FALSE(store.Apply(OpType::Append, "k", "b", 7, 2, outcome));
    EXPECT_EQ("a", outcome.Reply);
    EXPECT_EQ("ab", store.Get("k"));
}

TEST(KVStoreTest, ShowItemDescribesStoredValue) {
    KVStore store;
    OpOutcome outcome;
    std::string itemStr;

    EXPECT_FALSE(store.ShowItem("k", itemStr));
    store.Apply(OpType::Put, "k", "abc", 1, 1, outcome);
    ASSERT_TRUE(store.ShowItem("k", itemStr));
    EXPECT_NE(std::string::npos, itemStr.find("[abc]"));
}

TEST(KVStoreTest, ConcurrentAppendsAreAtomic) {
    KVStore store;
    const int numThreads = 4;
    const int numAppends = 200;
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; t++) {
        threads.push_back(std::thread([&store, t, numAppends]() {
            for (int i = 1; i <= numAppends; i++) {
                OpOutcome outcome;
                store.Apply(OpType::Append, "k", "x", t + 1, i, outcome);
            }
        }));
    }
    for (unsigned int i = 0; i < threads.size(); i++) {
        threads[i].join();
    }

    EXPECT_EQ(std::string(numThreads * numAppends, 'x'), store.Get("k"));
}
