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

#include "kvservice/clerk.h"
#include "messages/rpc_messages.pb.h"
#include "common/sys_config.h"
#include "common/sys_logger.h"
#include "common/exceptions.h"
#include "common/utils.h"
#include <boost/format.hpp>
#include <thread>
#include <chrono>

namespace skv {

    Clerk::Clerk(const std::vector<RPCEndpoint *> &servers, const ShardMap &shardMap)
            : _servers(servers),
              _shardMap(shardMap),
              _clientId(Utils::NRand()),
              _seq(0) {
        if ((int) _servers.size() != _shardMap.NumServers()) {
            throw KVOperationException((boost::format("Clerk got %d endpoints for %d servers.")
                                        % _servers.size() % _shardMap.NumServers()).str());
        }
    }

    void Clerk::Call(RPCMethod rid, const std::string &args, int shard, std::string &results) {
        int numReplicas = _shardMap.NumReplicasPerShard();
        int offset;
        {
            std::lock_guard<std::mutex> lk(_mutex);
            offset = _lastReplica[shard];
        }

        std::chrono::steady_clock::time_point deadline =
                std::chrono::steady_clock::now() + std::chrono::milliseconds(SysConfig::ClerkRetryTimeout);

        while (std::chrono::steady_clock::now() < deadline) {
            for (int attempt = 0; attempt < numReplicas; attempt++) {
                int replicaOffset = (offset + attempt) % numReplicas;
                int serverId = _shardMap.ReplicaAt(shard, replicaOffset);

                try {
                    _servers[serverId]->Call(rid, args, results);
                } catch (RPCTimeoutException &e) {
                    SDEBUG((boost::format("Clerk %d: %s on server %d failed: %s")
                            % _clientId % getTextForEnum(rid) % serverId % e.what()).str());
                    continue;
                }

                std::lock_guard<std::mutex> lk(_mutex);
                _lastReplica[shard] = replicaOffset;
                return;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(SysConfig::ClerkRetryInterval));
        }

        SLOG((boost::format("Clerk %d: %s on shard %d failed on all replicas within %d ms.")
              % _clientId % getTextForEnum(rid) % shard % SysConfig::ClerkRetryTimeout).str());
        throw RPCTimeoutException((boost::format("%s failed across all replicas of shard %d within deadline.")
                                   % getTextForEnum(rid) % shard).str());
    }

    std::string Clerk::Get(const std::string &key) {
        PbRpcKVGetArg args;
        PbRpcKVGetResult result;
        std::string serializedResult;

        // reads carry no sequence number, they are never deduplicated
        args.set_key(key);

        Call(RPCMethod::Get, args.SerializeAsString(), _shardMap.ShardOf(key), serializedResult);

        if (!result.ParseFromString(serializedResult)) {
            throw KVOperationException("Malformed Get result.");
        }
        return result.value();
    }

    std::string Clerk::PutAppend(const std::string &key, const std::string &value, RPCMethod method) {
        PbRpcKVPutAppendArg args;
        PbRpcKVPutAppendResult result;
        std::string serializedResult;

        args.set_key(key);
        args.set_value(value);
        args.set_clientid(_clientId);

        std::lock_guard<std::mutex> opLock(_opMutex);
        {
            std::lock_guard<std::mutex> lk(_mutex);
            _seq += 1;
            args.set_seq(_seq);
        }

        Call(method, args.SerializeAsString(), _shardMap.ShardOf(key), serializedResult);

        if (!result.ParseFromString(serializedResult)) {
            throw KVOperationException("Malformed PutAppend result.");
        }
        return result.value();
    }

    void Clerk::Put(const std::string &key, const std::string &value) {
        PutAppend(key, value, RPCMethod::Put);
    }

    std::string Clerk::Append(const std::string &key, const std::string &value) {
        return PutAppend(key, value, RPCMethod::Append);
    }

} // namespace skv
