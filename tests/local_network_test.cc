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

#include "rpc/local_network.h"
#include "common/sys_config.h"
#include "common/exceptions.h"
#include "test_utils.h"
#include <gtest/gtest.h>
#include <atomic>
#include <string>

using namespace skv;

namespace {

    // Echoes the arguments back, or fails with the configured status.
    class EchoService : public RPCService {
    public:

        EchoService() : NumCalls(0), Status(RPC_OK) {
        }

        void HandleRequest(const PbRpcRequest &request, PbRpcReply &reply) {
            NumCalls += 1;
            reply.set_msgid(request.msgid());
            reply.set_status(Status);
            if (Status == RPC_OK) {
                reply.set_results(request.arguments());
            } else {
                reply.set_errormessage("refused");
            }
        }

        std::atomic<int> NumCalls;
        PbRpcStatus Status;
    };

    class LocalNetworkTest : public ::testing::Test {
    protected:
        ScopedSysConfig _savedConfig;
        LocalNetwork _network;
        EchoService _service;
    };

}

TEST_F(LocalNetworkTest, EnabledEndReachesServer) {
    _network.AddServer(3, &_service);
    RPCEndpoint *end = _network.MakeEnd("e");
    _network.Connect("e", 3);
    _network.Enable("e", true);

    std::string results;
    end->Call(RPCMethod::Get, "hello", results);

    EXPECT_EQ("hello", results);
    EXPECT_EQ(1, _service.NumCalls.load());
    EXPECT_EQ(1, _network.GetCount(3));
    EXPECT_EQ(0, _network.GetCount(0));
    EXPECT_EQ(1, _network.GetTotalCount());
}

TEST_F(LocalNetworkTest, EndsStartDisabled) {
    _network.AddServer(0, &_service);
    RPCEndpoint *end = _network.MakeEnd("e");
    _network.Connect("e", 0);

    std::string results;
    EXPECT_THROW(end->Call(RPCMethod::Get, "x", results), RPCTimeoutException);
    EXPECT_EQ(0, _service.NumCalls.load());

    _network.Enable("e", true);
    EXPECT_NO_THROW(end->Call(RPCMethod::Get, "x", results));

    _network.Enable("e", false);
    EXPECT_THROW(end->Call(RPCMethod::Get, "x", results), RPCTimeoutException);
    EXPECT_EQ(1, _service.NumCalls.load());
}

TEST_F(LocalNetworkTest, UnconnectedOrMissingServerTimesOut) {
    RPCEndpoint *end = _network.MakeEnd("e");
    _network.Enable("e", true);

    std::string results;
    EXPECT_THROW(end->Call(RPCMethod::Get, "x", results), RPCTimeoutException);

    _network.Connect("e", 1);
    EXPECT_THROW(end->Call(RPCMethod::Get, "x", results), RPCTimeoutException);

    _network.AddServer(1, &_service);
    EXPECT_NO_THROW(end->Call(RPCMethod::Get, "x", results));

    _network.DeleteServer(1);
    EXPECT_THROW(end->Call(RPCMethod::Get, "x", results), RPCTimeoutException);
}

TEST_F(LocalNetworkTest, ReplyStatusBecomesException) {
    _network.AddServer(0, &_service);
    RPCEndpoint *end = _network.MakeEnd("e");
    _network.Connect("e", 0);
    _network.Enable("e", true);

    std::string results;
    _service.Status = RPC_TIMEOUT;
    EXPECT_THROW(end->Call(RPCMethod::Get, "x", results), RPCTimeoutException);

    _service.Status = RPC_FAILED;
    EXPECT_THROW(end->Call(RPCMethod::Get, "x", results), KVOperationException);
}

TEST_F(LocalNetworkTest, EndNamesAreUniqueUntilDeleted) {
    _network.MakeEnd("e");
    EXPECT_THROW(_network.MakeEnd("e"), KVOperationException);

    _network.DeleteEnd("e");
    RPCEndpoint *again = _network.MakeEnd("e");
    ASSERT_TRUE(again != NULL);

    // a recreated end does not inherit the old link
    _network.AddServer(0, &_service);
    std::string results;
    EXPECT_THROW(again->Call(RPCMethod::Get, "x", results), RPCTimeoutException);
}

TEST_F(LocalNetworkTest, ScopedEndIsDeletedOnExit) {
    {
        ScopedEnd end(&_network, "scoped");
        EXPECT_EQ("scoped", end.Name());
    }
    EXPECT_NO_THROW(_network.MakeEnd("scoped"));
}

TEST_F(LocalNetworkTest, UnreliableModeDropsRequests) {
    SysConfig::UnreliableDropRatio = 1.0;
    _network.AddServer(0, &_service);
    RPCEndpoint *end = _network.MakeEnd("e");
    _network.Connect("e", 0);
    _network.Enable("e", true);
    _network.SetReliable(false);

    std::string results;
    EXPECT_THROW(end->Call(RPCMethod::Get, "x", results), RPCTimeoutException);
    EXPECT_EQ(0, _service.NumCalls.load());

    _network.SetReliable(true);
    EXPECT_NO_THROW(end->Call(RPCMethod::Get, "x", results));
}

TEST_F(LocalNetworkTest, UnreliableModeDropsSomeRepliesAfterHandling) {
    SysConfig::UnreliableDropRatio = 0.5;
    _network.AddServer(0, &_service);
    RPCEndpoint *end = _network.MakeEnd("e");
    _network.Connect("e", 0);
    _network.Enable("e", true);
    _network.SetReliable(false);

    int numSucceeded = 0;
    for (int i = 0; i < 200; i++) {
        std::string results;
        try {
            end->Call(RPCMethod::Get, "x", results);
            numSucceeded += 1;
        } catch (RPCTimeoutException &e) {
            // lost request or reply
        }
    }

    EXPECT_GT(numSucceeded, 0);
    EXPECT_LT(numSucceeded, 200);
    // handled but reported as lost
    EXPECT_GT(_service.NumCalls.load(), numSucceeded);
    EXPECT_EQ(_service.NumCalls.load(), _network.GetCount(0));
}
