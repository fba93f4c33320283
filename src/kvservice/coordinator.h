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

#ifndef SKV_KVSERVICE_COORDINATOR_H
#define SKV_KVSERVICE_COORDINATOR_H

#include "common/types.h"
#include "kvservice/cluster_config.h"
#include "kvstore/kv_store.h"
#include <string>
#include <atomic>
#include <stdint.h>

namespace skv {

    // Role logic of one storage node. Whether the node serves, applies,
    // replicates or forwards an operation follows from its id and the
    // shard layout alone.
    class Coordinator : public ReplicaPeer {
    public:
        Coordinator(int serverId, ClusterConfig *config);

        ~Coordinator();

        // key-value interfaces

        // Throws RPCTimeoutException when this node holds no replica of key.
        std::string Get(const std::string &key);

        // Applies on the primary (then replicates to the backups) or forwards
        // to the primary. Throws RPCTimeoutException when forwarding gives up.
        void PutAppend(OpType op,
                       const std::string &key,
                       const std::string &value,
                       uint64_t clientId,
                       int64_t seq,
                       OpOutcome &outcome);

        // replication
        bool ApplyReplicatedUpdate(const ReplicatedUpdate &update);

        // debugging
        bool ShowItem(const std::string &key, std::string &itemStr);

        bool ShowState(std::string &stateStr);

    public:

        int ServerId() const {
            return _serverId;
        }

        KVStore &Store() {
            return _store;
        }

    private:
        void Replicate(OpType op,
                       const std::string &key,
                       uint64_t clientId,
                       int64_t seq,
                       const OpOutcome &outcome);

        void Forward(OpType op,
                     const std::string &key,
                     const std::string &value,
                     uint64_t clientId,
                     int64_t seq,
                     OpOutcome &outcome);

        int _serverId;
        ClusterConfig *_config;
        KVStore _store;
        std::atomic<int64_t> _forwardCounter;
    };

} // namespace skv

#endif
