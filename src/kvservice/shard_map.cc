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

#include "kvservice/shard_map.h"
#include "common/exceptions.h"
#include <boost/format.hpp>

namespace skv {

    ShardMap::ShardMap(int numServers, int numReplicasPerShard)
            : _numServers(numServers),
              _numReplicasPerShard(numReplicasPerShard) {
        if (numServers < 1 || numReplicasPerShard < 1 || numReplicasPerShard > numServers) {
            throw KVOperationException((boost::format("Invalid shard layout: %d servers, %d replicas per shard.")
                                        % numServers % numReplicasPerShard).str());
        }
    }

    bool ShardMap::IsNumericKey(const std::string &key) {
        if (key.empty()) {
            return false;
        }
        for (unsigned int i = 0; i < key.size(); i++) {
            if (key[i] < '0' || key[i] > '9') {
                return false;
            }
        }
        return true;
    }

    uint64_t ShardMap::KeyId(const std::string &key) {
        uint64_t id = 0;

        if (IsNumericKey(key)) {
            for (unsigned int i = 0; i < key.size(); i++) {
                id = id * 10 + (key[i] - '0');
            }
        } else {
            for (unsigned int i = 0; i < key.size(); i++) {
                id += static_cast<unsigned char>(key[i]);
            }
        }

        return id;
    }

    int ShardMap::ShardOf(const std::string &key) const {
        uint64_t n = _numServers;
        uint64_t shard = 0;

        if (IsNumericKey(key)) {
            // Horner's rule mod n, exact for keys of any length
            for (unsigned int i = 0; i < key.size(); i++) {
                shard = (shard * 10 + (key[i] - '0')) % n;
            }
        } else {
            shard = KeyId(key) % n;
        }

        return static_cast<int>(shard);
    }

    std::vector<int> ShardMap::Replicas(int shard) const {
        std::vector<int> replicas;
        for (int k = 0; k < _numReplicasPerShard; k++) {
            replicas.push_back((shard + k) % _numServers);
        }
        return replicas;
    }

    std::vector<int> ShardMap::Backups(int shard) const {
        std::vector<int> backups;
        for (int k = 1; k < _numReplicasPerShard; k++) {
            backups.push_back((shard + k) % _numServers);
        }
        return backups;
    }

    int ShardMap::ReplicaAt(int shard, int offset) const {
        return (shard + offset % _numReplicasPerShard) % _numServers;
    }

    bool ShardMap::IsPrimaryFor(int serverId, const std::string &key) const {
        return serverId == PrimaryFor(key);
    }

    bool ShardMap::IsResponsibleFor(int serverId, const std::string &key) const {
        int offset = ((serverId - PrimaryFor(key)) % _numServers + _numServers) % _numServers;
        return offset < _numReplicasPerShard;
    }

} // namespace skv
