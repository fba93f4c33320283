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

#include "kvstore/kv_store.h"
#include "common/sys_logger.h"
#include "common/sys_stats.h"
#include <boost/format.hpp>

namespace skv {

    KVStore::KVStore() {
    }

    std::string KVStore::Get(const std::string &key) {
        std::lock_guard<std::mutex> lk(_mutex);

        ItemTable::iterator it = _items.find(key);
        if (it == _items.end()) {
            return "";
        }
        return it->second;
    }

    bool KVStore::IsDuplicate(uint64_t clientId, int64_t seq, OpOutcome *cached) {
        ClientOpTable::iterator it = _lastOps.find(clientId);
        if (it == _lastOps.end() || seq > it->second.Seq) {
            return false;
        }

        if (cached != NULL) {
            cached->HasReply = it->second.HasReply;
            cached->Reply = it->second.Reply;
        }
        return true;
    }

    bool KVStore::Apply(OpType op,
                        const std::string &key,
                        const std::string &value,
                        uint64_t clientId,
                        int64_t seq,
                        OpOutcome &outcome) {
        std::lock_guard<std::mutex> lk(_mutex);

        if (IsDuplicate(clientId, seq, &outcome)) {
            SysStats::NumDuplicateRequests += 1;
            SDEBUG((boost::format("KVStore: duplicate %s client %d seq %d")
                    % key % clientId % seq).str());
            return false;
        }

        std::string &item = _items[key];

        if (op == OpType::Append) {
            outcome.HasReply = true;
            outcome.Reply = item;
            item += value;
        } else {
            outcome.HasReply = false;
            outcome.Reply.clear();
            item = value;
        }
        outcome.NewValue = item;

        ClientOpRecord &record = _lastOps[clientId];
        record.Seq = seq;
        record.HasReply = outcome.HasReply;
        record.Reply = outcome.Reply;

        return true;
    }

    bool KVStore::ApplyReplicated(const ReplicatedUpdate &update) {
        std::lock_guard<std::mutex> lk(_mutex);

        if (IsDuplicate(update.ClientId, update.Seq, NULL)) {
            return false;
        }

        _items[update.Key] = update.NewValue;

        ClientOpRecord &record = _lastOps[update.ClientId];
        record.Seq = update.Seq;
        record.HasReply = update.HasReply;
        record.Reply = update.Reply;

        return true;
    }

    bool KVStore::ShowItem(const std::string &key, std::string &itemStr) {
        std::lock_guard<std::mutex> lk(_mutex);

        ItemTable::iterator it = _items.find(key);
        if (it == _items.end()) {
            return false;
        }

        itemStr = (boost::format("%s = [%s] (%d bytes)") % key % it->second % it->second.size()).str();
        return true;
    }

    int KVStore::Size() {
        std::lock_guard<std::mutex> lk(_mutex);
        return _items.size();
    }

    int KVStore::NumClients() {
        std::lock_guard<std::mutex> lk(_mutex);
        return _lastOps.size();
    }

} // namespace skv
