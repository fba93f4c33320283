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

#ifndef SKV_RPC_TCP_NETWORK_H
#define SKV_RPC_TCP_NETWORK_H

#include "rpc/network.h"
#include "rpc/sync_rpc_client.h"
#include "common/types.h"
#include <boost/thread.hpp>
#include <unordered_map>
#include <vector>
#include <memory>
#include <string>
#include <atomic>
#include <mutex>

namespace skv {

    // Endpoints that reach servers over TCP. Server ids index the address
    // list given at construction. Socket failures and socket timeouts
    // surface as RPCTimeoutException; disabling an endpoint makes its calls
    // fail locally without touching the network.
    class TCPNetwork : public Network {
    public:
        TCPNetwork(const std::vector<ServerAddress> &servers);

        ~TCPNetwork();

        RPCEndpoint *MakeEnd(const std::string &endName);

        void Connect(const std::string &endName, int serverId);

        void Enable(const std::string &endName, bool enabled);

        void DeleteEnd(const std::string &endName);

    private:
        class TCPEnd : public RPCEndpoint {
        public:

            TCPEnd(const std::string &endName)
                    : _endName(endName),
                      _enabled(false) {
            }

            void Call(RPCMethod rid, const std::string &args, std::string &results);

            void Connect(const ServerAddress &server);

            void Enable(bool enabled) {
                _enabled = enabled;
            }

        private:
            std::string _endName;
            std::atomic<bool> _enabled;
            std::mutex _clientMutex;
            std::shared_ptr<SyncRPCClient> _rpcClient;
        };

        typedef boost::shared_lock<boost::shared_mutex> Shared;
        typedef boost::unique_lock<boost::shared_mutex> Exclusive;

        TCPEnd *FindEnd(const std::string &endName);

        std::vector<ServerAddress> _servers;
        boost::shared_mutex _mutex;
        std::unordered_map<std::string, TCPEnd *> _ends;
    };

} // namespace skv

#endif
