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

#include "test_utils.h"
#include "kvservice/clerk.h"
#include "common/sys_config.h"
#include "common/sys_stats.h"
#include "common/exceptions.h"
#include "messages/rpc_messages.pb.h"
#include <boost/format.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <string>

using namespace skv;

namespace {

    class KVServiceTest : public ::testing::Test {
    protected:

        static std::string Append(RPCEndpoint *end, const std::string &key, const std::string &value,
                                  uint64_t clientId, int64_t seq) {
            return PutAppend(end, RPCMethod::Append, key, value, clientId, seq);
        }

        static void Put(RPCEndpoint *end, const std::string &key, const std::string &value,
                        uint64_t clientId, int64_t seq) {
            PutAppend(end, RPCMethod::Put, key, value, clientId, seq);
        }

        static std::string PutAppend(RPCEndpoint *end, RPCMethod method, const std::string &key,
                                     const std::string &value, uint64_t clientId, int64_t seq) {
            PbRpcKVPutAppendArg args;
            args.set_key(key);
            args.set_value(value);
            args.set_clientid(clientId);
            args.set_seq(seq);

            std::string serializedResult;
            end->Call(method, args.SerializeAsString(), serializedResult);

            PbRpcKVPutAppendResult result;
            EXPECT_TRUE(result.ParseFromString(serializedResult));
            return result.value();
        }

        static std::string Get(RPCEndpoint *end, const std::string &key) {
            PbRpcKVGetArg args;
            args.set_key(key);

            std::string serializedResult;
            end->Call(RPCMethod::Get, args.SerializeAsString(), serializedResult);

            PbRpcKVGetResult result;
            EXPECT_TRUE(result.ParseFromString(serializedResult));
            return result.value();
        }

        ScopedSysConfig _savedConfig;
    };

}

// N=3, R=2: key "5" lives on shard 2, primary 2, backup 0.
TEST_F(KVServiceTest, PrimaryAppliesAndBackupFollows) {
    KVTestCluster cluster(3, 2);
    RPCEndpoint *toPrimary = cluster.MakeEnd(2);
    RPCEndpoint *toBackup = cluster.MakeEnd(0);

    Put(toPrimary, "5", "a", 42, 1);
    EXPECT_EQ("a", cluster.ValueAt(2, "5"));
    EXPECT_EQ("a", cluster.ValueAt(0, "5"));
    EXPECT_EQ("", cluster.ValueAt(1, "5"));

    EXPECT_EQ("a", Append(toPrimary, "5", "b", 42, 2));
    EXPECT_EQ("ab", cluster.ValueAt(2, "5"));

    // the same append retried is answered from the dedup table
    EXPECT_EQ("a", Append(toPrimary, "5", "b", 42, 2));
    EXPECT_EQ("ab", cluster.ValueAt(2, "5"));

    EXPECT_EQ("ab", Get(toBackup, "5"));
    EXPECT_EQ("ab", Get(toPrimary, "5"));
}

TEST_F(KVServiceTest, ClerkOperations) {
    KVTestCluster cluster(3, 2);
    Clerk *clerk = cluster.MakeClerk();

    EXPECT_EQ("", clerk->Get("missing"));

    clerk->Put("5", "a");
    EXPECT_EQ("a", clerk->Append("5", "b"));
    EXPECT_EQ("ab", clerk->Append("5", "c"));
    EXPECT_EQ("abc", clerk->Get("5"));

    clerk->Put("5", "z");
    EXPECT_EQ("z", clerk->Get("5"));

    // a fresh key appends onto ""
    EXPECT_EQ("", clerk->Append("hello", "world"));
    EXPECT_EQ("world", clerk->Get("hello"));
}

TEST_F(KVServiceTest, ClerksShareState) {
    KVTestCluster cluster(4, 2);
    Clerk *a = cluster.MakeClerk();
    Clerk *b = cluster.MakeClerk();

    EXPECT_NE(a->ClientId(), b->ClientId());

    a->Put("k", "1");
    EXPECT_EQ("1", b->Append("k", "2"));
    EXPECT_EQ("12", a->Get("k"));
}

TEST_F(KVServiceTest, ReplicasConverge) {
    KVTestCluster cluster(5, 3);
    Clerk *clerk = cluster.MakeClerk();

    for (int i = 0; i < 30; i++) {
        std::string key = (boost::format("%d") % i).str();
        clerk->Put(key, "v");
        clerk->Append(key, key);
    }

    for (int i = 0; i < 30; i++) {
        std::string key = (boost::format("%d") % i).str();
        int shard = cluster.Shards().ShardOf(key);
        std::vector<int> replicas = cluster.Shards().Replicas(shard);

        for (int id = 0; id < cluster.NumServers(); id++) {
            bool responsible = cluster.Shards().IsResponsibleFor(id, key);
            EXPECT_EQ(responsible ? "v" + key : "", cluster.ValueAt(id, key))
                                << "key " << key << " server " << id;
        }
        EXPECT_EQ(3u, replicas.size());
    }
}

TEST_F(KVServiceTest, NonPrimaryForwardsWrites) {
    KVTestCluster cluster(3, 2);
    RPCEndpoint *toBackup = cluster.MakeEnd(0);
    RPCEndpoint *toOutsider = cluster.MakeEnd(1);
    int forwarded = SysStats::NumForwardedRequests;

    // server 0 is a backup of shard 2, server 1 holds no replica of it
    Put(toBackup, "5", "a", 42, 1);
    EXPECT_EQ("a", Append(toOutsider, "5", "b", 42, 2));

    EXPECT_EQ("ab", cluster.ValueAt(2, "5"));
    EXPECT_EQ("ab", cluster.ValueAt(0, "5"));
    EXPECT_EQ("", cluster.ValueAt(1, "5"));
    EXPECT_EQ(2, SysStats::NumForwardedRequests - forwarded);

    // both writes went through the primary, over the network
    EXPECT_EQ(2, cluster.Net().GetCount(2));

    // a forwarded retry is still deduplicated at the primary
    EXPECT_EQ("a", Append(toBackup, "5", "b", 42, 2));
    EXPECT_EQ("ab", cluster.ValueAt(2, "5"));
}

TEST_F(KVServiceTest, GetOnServerWithoutReplicaTimesOut) {
    KVTestCluster cluster(3, 2);
    RPCEndpoint *toOutsider = cluster.MakeEnd(1);
    int rejected = SysStats::NumRejectedGetRequests;

    EXPECT_THROW(Get(toOutsider, "5"), RPCTimeoutException);
    EXPECT_EQ(1, SysStats::NumRejectedGetRequests - rejected);
}

TEST_F(KVServiceTest, UnknownMethodFails) {
    KVTestCluster cluster(1, 1);
    PbRpcRequest request;
    PbRpcReply reply;
    request.set_msgid(9);
    request.set_methodid(77);

    cluster.Server(0)->HandleRequest(request, reply);

    EXPECT_EQ(9, reply.msgid());
    EXPECT_EQ(RPC_FAILED, reply.status());
}

TEST_F(KVServiceTest, ShowStateReportsServer) {
    KVTestCluster cluster(3, 2);
    cluster.MakeClerk()->Put("5", "a");
    RPCEndpoint *toPrimary = cluster.MakeEnd(2);

    std::string serializedResult;
    toPrimary->Call(RPCMethod::ShowState, "", serializedResult);

    PbRpcKVShowResult result;
    ASSERT_TRUE(result.ParseFromString(serializedResult));
    EXPECT_TRUE(result.succeeded());
    EXPECT_NE(std::string::npos, result.returnstring().find("SERVER_ID 2"));
    EXPECT_NE(std::string::npos, result.returnstring().find("NUM_KEYS 1"));
}

TEST_F(KVServiceTest, ShowItemReadsReplicaCopy) {
    KVTestCluster cluster(3, 2);
    cluster.MakeClerk()->Put("5", "abc");

    PbRpcKVShowArg arg;
    arg.set_key("5");
    PbRpcKVShowResult result;
    std::string serializedResult;

    // backup 0 holds the replicated value
    cluster.MakeEnd(0)->Call(RPCMethod::ShowItem, arg.SerializeAsString(), serializedResult);
    ASSERT_TRUE(result.ParseFromString(serializedResult));
    EXPECT_TRUE(result.succeeded());
    EXPECT_NE(std::string::npos, result.returnstring().find("[abc]"));

    // server 1 is not a replica of shard 2
    cluster.MakeEnd(1)->Call(RPCMethod::ShowItem, arg.SerializeAsString(), serializedResult);
    ASSERT_TRUE(result.ParseFromString(serializedResult));
    EXPECT_FALSE(result.succeeded());
}

TEST_F(KVServiceTest, ClerkFallsBackToBackupForReads) {
    KVTestCluster cluster(3, 2);
    Clerk *clerk = cluster.MakeClerk();
    clerk->Put("5", "a");

    cluster.ShutdownServer(2);
    EXPECT_EQ("a", clerk->Get("5"));

    cluster.StartServer(2);
    EXPECT_EQ("a", clerk->Append("5", "b"));
    EXPECT_EQ("ab", clerk->Get("5"));
}

TEST_F(KVServiceTest, ClerkRemembersReplicaThatAnswered) {
    KVTestCluster cluster(3, 2);
    Clerk *clerk = cluster.MakeClerk();
    clerk->Put("5", "a");

    cluster.ShutdownServer(2);
    EXPECT_EQ("a", clerk->Get("5"));
    cluster.StartServer(2);

    // the primary is back, but the next read starts at backup 0
    int primaryCount = cluster.Net().GetCount(2);
    int backupCount = cluster.Net().GetCount(0);
    EXPECT_EQ("a", clerk->Get("5"));
    EXPECT_EQ(primaryCount, cluster.Net().GetCount(2));
    EXPECT_EQ(backupCount + 1, cluster.Net().GetCount(0));

    // other shards keep their own starting replica
    int shard1Count = cluster.Net().GetCount(1);
    EXPECT_EQ("", clerk->Get("1"));
    EXPECT_EQ(shard1Count + 1, cluster.Net().GetCount(1));
}

TEST_F(KVServiceTest, SharedClerkAppliesEveryAppend) {
    KVTestCluster cluster(1, 1);
    Clerk *clerk = cluster.MakeClerk();
    const int numThreads = 4;
    const int numAppends = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; t++) {
        threads.push_back(std::thread([clerk, t, numAppends]() {
            std::string key = (boost::format("k%d") % t).str();
            for (int i = 0; i < numAppends; i++) {
                clerk->Append(key, "x");
            }
        }));
    }
    for (unsigned int i = 0; i < threads.size(); i++) {
        threads[i].join();
    }

    for (int t = 0; t < numThreads; t++) {
        std::string key = (boost::format("k%d") % t).str();
        EXPECT_EQ(std::string(numAppends, 'x'), clerk->Get(key)) << key;
    }
}

TEST_F(KVServiceTest, ClerkGivesUpWhenPrimaryIsDown) {
    SysConfig::ClerkRetryTimeout = 300;
    SysConfig::ForwardTimeout = 100;
    SysConfig::ForwardRetryInterval = 10;

    KVTestCluster cluster(3, 2);
    Clerk *clerk = cluster.MakeClerk();
    clerk->Put("5", "a");

    cluster.ShutdownServer(2);
    EXPECT_THROW(clerk->Put("5", "b"), RPCTimeoutException);
    EXPECT_EQ("a", cluster.ValueAt(0, "5"));

    // the caller retries once the primary is back
    cluster.StartServer(2);
    clerk->Put("5", "c");
    EXPECT_EQ("c", clerk->Get("5"));
    EXPECT_EQ("c", cluster.ValueAt(0, "5"));
}

TEST_F(KVServiceTest, ClerkTimesOutWhenShardIsUnreachable) {
    SysConfig::ClerkRetryTimeout = 200;

    KVTestCluster cluster(3, 2);
    cluster.ShutdownServer(2);
    cluster.ShutdownServer(0);
    Clerk *clerk = cluster.MakeClerk();

    EXPECT_THROW(clerk->Get("5"), RPCTimeoutException);
    // shard 1 lives on servers 1 and 2
    EXPECT_EQ("", clerk->Get("1"));
}

TEST_F(KVServiceTest, OpCounterCountsAppliedOperations) {
    KVTestCluster cluster(3, 2);
    RPCEndpoint *toPrimary = cluster.MakeEnd(2);
    RPCEndpoint *toBackup = cluster.MakeEnd(0);

    Put(toPrimary, "5", "a", 42, 1);
    Append(toBackup, "5", "b", 42, 2);
    EXPECT_EQ(2, cluster.Config().NumOps());

    // duplicates and backup applies are not counted
    Append(toPrimary, "5", "b", 42, 2);
    EXPECT_EQ(2, cluster.Config().NumOps());

    Get(toBackup, "5");
    EXPECT_EQ(3, cluster.Config().NumOps());
}

TEST_F(KVServiceTest, ConcurrentClerksOnUnreliableNetwork) {
    KVTestCluster cluster(3, 2);
    const int numClerks = 4;
    const int numAppends = 25;
    std::vector<Clerk *> clerks;
    for (int c = 0; c < numClerks; c++) {
        clerks.push_back(cluster.MakeClerk());
    }

    cluster.Net().SetReliable(false);

    std::vector<std::thread> threads;
    for (int c = 0; c < numClerks; c++) {
        Clerk *clerk = clerks[c];
        threads.push_back(std::thread([clerk, c, numAppends]() {
            std::string own = (boost::format("own%d") % c).str();
            for (int i = 0; i < numAppends; i++) {
                std::string token = (boost::format("[%d.%d]") % c % i).str();
                clerk->Append("shared", token);
                clerk->Append(own, token);
            }
        }));
    }
    for (unsigned int i = 0; i < threads.size(); i++) {
        threads[i].join();
    }

    cluster.Net().SetReliable(true);

    std::string shared = clerks[0]->Get("shared");
    for (int c = 0; c < numClerks; c++) {
        std::string own = (boost::format("own%d") % c).str();
        std::string expected;
        size_t last = 0;
        for (int i = 0; i < numAppends; i++) {
            std::string token = (boost::format("[%d.%d]") % c % i).str();
            expected += token;

            // each token exactly once, in the clerk's order
            size_t pos = shared.find(token);
            ASSERT_NE(std::string::npos, pos) << token;
            EXPECT_EQ(std::string::npos, shared.find(token, pos + 1)) << token;
            EXPECT_GE(pos, last);
            last = pos;
        }
        EXPECT_EQ(expected, clerks[c]->Get(own));

        int shard = cluster.Shards().ShardOf(own);
        std::vector<int> replicas = cluster.Shards().Replicas(shard);
        for (unsigned int r = 0; r < replicas.size(); r++) {
            EXPECT_EQ(expected, cluster.ValueAt(replicas[r], own));
        }
    }
}
