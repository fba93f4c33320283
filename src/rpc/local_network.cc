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
#include "common/sys_logger.h"
#include "common/utils.h"
#include "common/exceptions.h"
#include <thread>
#include <chrono>

namespace skv {

    void LocalNetwork::LocalEnd::Call(RPCMethod rid, const std::string &args, std::string &results) {
        PbRpcRequest request;
        PbRpcReply reply;

        request.set_msgid(GetMessageId());
        request.set_methodid(static_cast<int32_t> (rid));
        request.set_arguments(args);

        _network->Dispatch(_endName, request, reply);

        CheckReply(rid, reply);
        results = reply.results();
    }

    LocalNetwork::LocalNetwork()
            : _reliable(true) {
    }

    LocalNetwork::~LocalNetwork() {
        Exclusive lock(_mutex);
        for (auto it = _ends.begin(); it != _ends.end(); ++it) {
            delete it->second;
        }
        _ends.clear();
    }

    RPCEndpoint *LocalNetwork::MakeEnd(const std::string &endName) {
        Exclusive lock(_mutex);

        if (_ends.find(endName) != _ends.end()) {
            throw KVOperationException((boost::format("MakeEnd: %s already exists.") % endName).str());
        }

        LocalEnd *end = new LocalEnd(this, endName);
        _ends[endName] = end;
        _enabled[endName] = false;
        _connections.erase(endName);

        return end;
    }

    void LocalNetwork::Connect(const std::string &endName, int serverId) {
        Exclusive lock(_mutex);
        _connections[endName] = serverId;
    }

    void LocalNetwork::Enable(const std::string &endName, bool enabled) {
        Exclusive lock(_mutex);
        _enabled[endName] = enabled;
    }

    void LocalNetwork::DeleteEnd(const std::string &endName) {
        Exclusive lock(_mutex);

        auto it = _ends.find(endName);
        if (it != _ends.end()) {
            delete it->second;
            _ends.erase(it);
        }
        _enabled.erase(endName);
        _connections.erase(endName);
    }

    void LocalNetwork::AddServer(int serverId, RPCService *service) {
        Exclusive lock(_mutex);
        _servers[serverId] = service;
    }

    void LocalNetwork::DeleteServer(int serverId) {
        Exclusive lock(_mutex);
        _servers.erase(serverId);
    }

    void LocalNetwork::SetReliable(bool reliable) {
        _reliable = reliable;
    }

    int LocalNetwork::GetCount(int serverId) {
        std::lock_guard<std::mutex> lk(_countMutex);
        auto it = _counts.find(serverId);
        return it == _counts.end() ? 0 : it->second;
    }

    int LocalNetwork::GetTotalCount() {
        std::lock_guard<std::mutex> lk(_countMutex);
        int total = 0;
        for (auto it = _counts.begin(); it != _counts.end(); ++it) {
            total += it->second;
        }
        return total;
    }

    void LocalNetwork::SimulateFailure(const std::string &endName,
                                       const PbRpcRequest &request,
                                       const char *reason) {
        std::this_thread::sleep_for(std::chrono::microseconds(SysConfig::NetworkFailureDelay));

        throw RPCTimeoutException((boost::format("%s via %s: %s")
                                   % getTextForEnum(static_cast<RPCMethod>(request.methodid()))
                                   % endName % reason).str());
    }

    void LocalNetwork::Dispatch(const std::string &endName, const PbRpcRequest &request, PbRpcReply &reply) {
        RPCService *service = NULL;
        bool enabled = false;
        int serverId = -1;

        {
            Shared lock(_mutex);

            auto enabledIt = _enabled.find(endName);
            enabled = enabledIt != _enabled.end() && enabledIt->second;

            auto connIt = _connections.find(endName);
            if (connIt != _connections.end()) {
                serverId = connIt->second;
                auto serverIt = _servers.find(serverId);
                if (serverIt != _servers.end()) {
                    service = serverIt->second;
                }
            }
        }

        if (!enabled) {
            SimulateFailure(endName, request, "endpoint disabled");
        }
        if (service == NULL) {
            SimulateFailure(endName, request, "no such server");
        }
        if (!_reliable && Utils::RandomDouble() < SysConfig::UnreliableDropRatio) {
            SimulateFailure(endName, request, "request dropped");
        }

        {
            std::lock_guard<std::mutex> lk(_countMutex);
            _counts[serverId] += 1;
        }

        // the handler runs without any network lock held, it may call back
        // into the network to forward the request
        service->HandleRequest(request, reply);

        if (!_reliable && Utils::RandomDouble() < SysConfig::UnreliableDropRatio) {
            SimulateFailure(endName, request, "reply dropped");
        }
    }

} // namespace skv
