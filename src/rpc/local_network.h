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

#ifndef SKV_RPC_LOCAL_NETWORK_H
#define SKV_RPC_LOCAL_NETWORK_H

#include "rpc/network.h"
#include "rpc/abstract_rpc_client.h"
#include <boost/thread.hpp>
#include <unordered_map>
#include <string>
#include <atomic>
#include <mutex>

namespace skv {

    // In-process network. Calls are delivered synchronously on the caller's
    // thread to the RPCService registered under the endpoint's server id.
    // A call through a disabled or unconnected endpoint, or to a server that
    // is not registered, fails with RPCTimeoutException after
    // SysConfig::NetworkFailureDelay. In unreliable mode a share of requests,
    // and of replies after the handler ran, is dropped the same way.
    //
    // Registered services must outlive any call made through the network.
    class LocalNetwork : public Network {
    public:
        LocalNetwork();

        ~LocalNetwork();

        RPCEndpoint *MakeEnd(const std::string &endName);

        void Connect(const std::string &endName, int serverId);

        void Enable(const std::string &endName, bool enabled);

        void DeleteEnd(const std::string &endName);

        void AddServer(int serverId, RPCService *service);

        void DeleteServer(int serverId);

        void SetReliable(bool reliable);

        // number of requests delivered to a server
        int GetCount(int serverId);

        int GetTotalCount();

    private:
        class LocalEnd : public RPCEndpoint, public AbstractRPCClient {
        public:

            LocalEnd(LocalNetwork *network, const std::string &endName)
                    : _network(network),
                      _endName(endName) {
            }

            void Call(RPCMethod rid, const std::string &args, std::string &results);

        private:
            LocalNetwork *_network;
            std::string _endName;
        };

        typedef boost::shared_lock<boost::shared_mutex> Shared;
        typedef boost::unique_lock<boost::shared_mutex> Exclusive;

        void Dispatch(const std::string &endName, const PbRpcRequest &request, PbRpcReply &reply);

        void SimulateFailure(const std::string &endName, const PbRpcRequest &request, const char *reason);

        boost::shared_mutex _mutex;
        std::unordered_map<std::string, LocalEnd *> _ends;
        std::unordered_map<std::string, bool> _enabled;
        std::unordered_map<std::string, int> _connections;
        std::unordered_map<int, RPCService *> _servers;

        std::mutex _countMutex;
        std::unordered_map<int, int> _counts;

        std::atomic<bool> _reliable;
    };

} // namespace skv

#endif
