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

#ifndef SKV_KVSTORE_KV_STORE_H_
#define SKV_KVSTORE_KV_STORE_H_

#include "common/types.h"
#include <boost/utility.hpp>
#include <unordered_map>
#include <string>
#include <mutex>
#include <stdint.h>

namespace skv {

    typedef std::unordered_map<std::string, std::string> ItemTable;
    typedef std::unordered_map<uint64_t, ClientOpRecord> ClientOpTable;

    // Key/value items of one node plus its duplicate-suppression table, both
    // behind one exclusive lock that is held only for the in-memory step.
    class KVStore : boost::noncopyable {
    public:
        KVStore();

        // "" when the key is absent
        std::string Get(const std::string &key);

        // Applies a client mutation unless (clientId, seq) is not newer than the
        // last one applied for that client. Returns false for a duplicate, in
        // which case outcome holds the reply cached for the last applied seq.
        bool Apply(OpType op,
                   const std::string &key,
                   const std::string &value,
                   uint64_t clientId,
                   int64_t seq,
                   OpOutcome &outcome);

        // Backup side: stores the value the primary computed and caches its reply.
        bool ApplyReplicated(const ReplicatedUpdate &update);

        bool ShowItem(const std::string &key, std::string &itemStr);

        int Size();

        int NumClients();

    private:
        // caller holds _mutex
        bool IsDuplicate(uint64_t clientId, int64_t seq, OpOutcome *cached);

        std::mutex _mutex;
        ItemTable _items;
        ClientOpTable _lastOps;
    };

} // namespace skv

#endif
