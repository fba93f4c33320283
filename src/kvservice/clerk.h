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

#ifndef SKV_KVSERVICE_CLERK_H
#define SKV_KVSERVICE_CLERK_H

#include "kvservice/shard_map.h"
#include "rpc/network.h"
#include "rpc/rpc_id.h"
#include <boost/utility.hpp>
#include <unordered_map>
#include <string>
#include <vector>
#include <mutex>
#include <stdint.h>

namespace skv {

    // Client-side router. Computes the shard of every key and walks the
    // shard's replicas, starting from the one that answered last, until a
    // call succeeds or SysConfig::ClerkRetryTimeout runs out. Threads may
    // share a clerk; its Puts and Appends then run one at a time.
    class Clerk : boost::noncopyable {
    public:
        // servers[i] reaches server i; the endpoints are not owned.
        Clerk(const std::vector<RPCEndpoint *> &servers, const ShardMap &shardMap);

        // Returns "" for a missing key. Throws RPCTimeoutException when no
        // replica answered in time.
        std::string Get(const std::string &key);

        void Put(const std::string &key, const std::string &value);

        // Returns the value the key held before value was appended.
        std::string Append(const std::string &key, const std::string &value);

        uint64_t ClientId() const {
            return _clientId;
        }

    private:
        std::string PutAppend(const std::string &key, const std::string &value, RPCMethod method);

        void Call(RPCMethod rid, const std::string &args, int shard, std::string &results);

        std::vector<RPCEndpoint *> _servers;
        ShardMap _shardMap;
        uint64_t _clientId;

        // held from seq allocation until the reply, so the primary sees this
        // client's writes in seq order
        std::mutex _opMutex;

        std::mutex _mutex;
        int64_t _seq;
        std::unordered_map<int, int> _lastReplica; // shard -> offset that answered last
    };

} // namespace skv

#endif
