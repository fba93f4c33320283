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

#ifndef SKV_KVSERVICE_SHARD_MAP_H
#define SKV_KVSERVICE_SHARD_MAP_H

#include <string>
#include <vector>
#include <stdint.h>

namespace skv {

    // Static key -> shard -> replica assignment. Shard s is led by server s
    // and backed up by the next NumReplicasPerShard-1 servers (mod N). The
    // same mapping is computed independently by clerks and servers.
    class ShardMap {
    public:
        ShardMap(int numServers, int numReplicasPerShard);

        // Integer value of an all-digit key, else the sum of its byte values.
        // Digit keys wider than 64 bits wrap; ShardOf does not rely on it.
        static uint64_t KeyId(const std::string &key);

        static bool IsNumericKey(const std::string &key);

        int ShardOf(const std::string &key) const;

        int Primary(int shard) const {
            return shard;
        }

        int PrimaryFor(const std::string &key) const {
            return Primary(ShardOf(key));
        }

        // primary first, then the backups in order
        std::vector<int> Replicas(int shard) const;

        std::vector<int> Backups(int shard) const;

        // The server tried at position offset of the shard's replica list.
        int ReplicaAt(int shard, int offset) const;

        bool IsPrimaryFor(int serverId, const std::string &key) const;

        bool IsResponsibleFor(int serverId, const std::string &key) const;

        int NumServers() const {
            return _numServers;
        }

        int NumReplicasPerShard() const {
            return _numReplicasPerShard;
        }

    private:
        int _numServers;
        int _numReplicasPerShard;
    };

} // namespace skv

#endif
