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

#include "kvservice/cluster_config.h"
#include "common/exceptions.h"
#include <boost/format.hpp>

namespace skv {

    ClusterConfig::ClusterConfig(int numServers, int numReplicasPerShard, Network *network)
            : _shardMap(numServers, numReplicasPerShard),
              _network(network),
              _running(numServers, true),
              _peers(numServers, NULL),
              _numOps(0) {
    }

    void ClusterConfig::CheckServerId(int serverId) const {
        if (serverId < 0 || serverId >= NumServers()) {
            throw KVOperationException((boost::format("Unknown server %d.") % serverId).str());
        }
    }

    void ClusterConfig::SetRunning(int serverId, bool running) {
        CheckServerId(serverId);
        std::lock_guard<std::mutex> lk(_mutex);
        _running[serverId] = running;
    }

    bool ClusterConfig::IsRunning(int serverId) {
        CheckServerId(serverId);
        std::lock_guard<std::mutex> lk(_mutex);
        return _running[serverId];
    }

    void ClusterConfig::SetReplicaPeer(int serverId, ReplicaPeer *peer) {
        CheckServerId(serverId);
        std::lock_guard<std::mutex> lk(_mutex);
        _peers[serverId] = peer;
    }

    ReplicaPeer *ClusterConfig::GetReplicaPeer(int serverId) {
        CheckServerId(serverId);
        std::lock_guard<std::mutex> lk(_mutex);
        return _peers[serverId];
    }

} // namespace skv
