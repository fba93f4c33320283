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

#ifndef SKV_KVSERVICE_CLUSTER_CONFIG_H
#define SKV_KVSERVICE_CLUSTER_CONFIG_H

#include "common/types.h"
#include "kvservice/shard_map.h"
#include "rpc/network.h"
#include <boost/utility.hpp>
#include <vector>
#include <atomic>
#include <mutex>

namespace skv {

    // Receiver of mutations a primary has already applied.
    class ReplicaPeer {
    public:
        virtual ~ReplicaPeer() {
        }

        // Returns false when the update was a duplicate for the backup.
        virtual bool ApplyReplicatedUpdate(const ReplicatedUpdate &update) = 0;
    };

    // Static cluster shape shared by the servers of one deployment: the shard
    // layout, the network used to reach other servers, which servers are
    // running, how each server is reached for backup replication, and the
    // applied-operation counter.
    class ClusterConfig : boost::noncopyable {
    public:
        ClusterConfig(int numServers, int numReplicasPerShard, Network *network);

        int NumServers() const {
            return _shardMap.NumServers();
        }

        int NumReplicasPerShard() const {
            return _shardMap.NumReplicasPerShard();
        }

        const ShardMap &Shards() const {
            return _shardMap;
        }

        Network *Net() {
            return _network;
        }

        void SetRunning(int serverId, bool running);

        bool IsRunning(int serverId);

        // The peer is not owned by the configuration.
        void SetReplicaPeer(int serverId, ReplicaPeer *peer);

        ReplicaPeer *GetReplicaPeer(int serverId);

        // Counts one applied operation.
        void Op() {
            _numOps += 1;
        }

        int64_t NumOps() const {
            return _numOps;
        }

    private:
        void CheckServerId(int serverId) const;

        ShardMap _shardMap;
        Network *_network;
        std::mutex _mutex;
        std::vector<bool> _running;
        std::vector<ReplicaPeer *> _peers;
        std::atomic<int64_t> _numOps;
    };

} // namespace skv

#endif
