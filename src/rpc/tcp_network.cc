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

#include "rpc/tcp_network.h"
#include "common/sys_logger.h"
#include "common/exceptions.h"

namespace skv {

    void TCPNetwork::TCPEnd::Connect(const ServerAddress &server) {
        std::shared_ptr<SyncRPCClient> client(new SyncRPCClient(server.Name, server.Port));

        std::lock_guard<std::mutex> lk(_clientMutex);
        _rpcClient = client;
    }

    void TCPNetwork::TCPEnd::Call(RPCMethod rid, const std::string &args, std::string &results) {
        std::shared_ptr<SyncRPCClient> client;
        {
            std::lock_guard<std::mutex> lk(_clientMutex);
            client = _rpcClient;
        }

        if (!_enabled || !client) {
            throw RPCTimeoutException((boost::format("%s via %s: endpoint disabled")
                                       % getTextForEnum(rid) % _endName).str());
        }

        try {
            client->Call(rid, args, results);
        }
        catch (SocketException &e) {
            throw RPCTimeoutException((boost::format("%s via %s (%s:%d): %s")
                                       % getTextForEnum(rid) % _endName
                                       % client->Host() % client->Port() % e.what()).str());
        }
    }

    TCPNetwork::TCPNetwork(const std::vector<ServerAddress> &servers)
            : _servers(servers) {
    }

    TCPNetwork::~TCPNetwork() {
        Exclusive lock(_mutex);
        for (auto it = _ends.begin(); it != _ends.end(); ++it) {
            delete it->second;
        }
        _ends.clear();
    }

    TCPNetwork::TCPEnd *TCPNetwork::FindEnd(const std::string &endName) {
        Shared lock(_mutex);

        auto it = _ends.find(endName);
        if (it == _ends.end()) {
            throw KVOperationException((boost::format("No endpoint named %s.") % endName).str());
        }
        return it->second;
    }

    RPCEndpoint *TCPNetwork::MakeEnd(const std::string &endName) {
        Exclusive lock(_mutex);

        if (_ends.find(endName) != _ends.end()) {
            throw KVOperationException((boost::format("MakeEnd: %s already exists.") % endName).str());
        }

        TCPEnd *end = new TCPEnd(endName);
        _ends[endName] = end;
        return end;
    }

    void TCPNetwork::Connect(const std::string &endName, int serverId) {
        if (serverId < 0 || serverId >= (int) _servers.size()) {
            throw KVOperationException((boost::format("Connect: unknown server %d.") % serverId).str());
        }
        FindEnd(endName)->Connect(_servers[serverId]);
    }

    void TCPNetwork::Enable(const std::string &endName, bool enabled) {
        FindEnd(endName)->Enable(enabled);
    }

    void TCPNetwork::DeleteEnd(const std::string &endName) {
        Exclusive lock(_mutex);

        auto it = _ends.find(endName);
        if (it != _ends.end()) {
            delete it->second;
            _ends.erase(it);
        }
    }

} // namespace skv
