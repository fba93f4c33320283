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

#ifndef SKV_KVSERVICE_REPLICATION_KV_CLIENT_H
#define SKV_KVSERVICE_REPLICATION_KV_CLIENT_H

#include "common/types.h"
#include "kvservice/cluster_config.h"
#include "rpc/sync_rpc_client.h"
#include <boost/utility.hpp>
#include <string>

namespace skv {

    // Ships already-applied mutations to a backup running in another process.
    class ReplicationKVClient : public ReplicaPeer, boost::noncopyable {
    public:
        ReplicationKVClient(std::string serverName, int serverPort, int backupId);

        ~ReplicationKVClient();

        // Throws SocketException when the backup cannot be reached.
        bool ApplyReplicatedUpdate(const ReplicatedUpdate &update);

    private:
        std::string _serverName;
        int _serverPort;
        int _backupId;
        SyncRPCClient *_rpcClient;
    };

}

#endif
