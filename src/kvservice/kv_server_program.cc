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

#include "kvservice/kv_server.h"
#include "kvservice/cluster_config.h"
#include "kvservice/replication_kv_client.h"
#include "rpc/tcp_network.h"
#include "common/sys_config.h"
#include "common/exceptions.h"
#include "common/utils.h"
#include "common/types.h"
#include <stdlib.h>
#include <stdio.h>
#include <vector>
#include <memory>

using namespace skv;

int main(int argc, char *argv[]) {

    fprintf(stdout, "KVServerProgram!\n");
    if (argc != 4) {
        fprintf(stdout, "Usage: %s <ServerId> <NumReplicasPerShard> <ServerList: host1:port1,host2:port2,...>\n",
                argv[0]);
        exit(1);
    }

    int serverId = atoi(argv[1]);
    int numReplicasPerShard = atoi(argv[2]);

    try {
        std::vector<ServerAddress> servers = Utils::str2servers(argv[3]);

        TCPNetwork network(servers);
        ClusterConfig config(servers.size(), numReplicasPerShard, &network);
        KVServer server(serverId, &config);

        // backups in other processes are reached over their public port
        std::vector<std::unique_ptr<ReplicationKVClient>> peers;
        for (unsigned int i = 0; i < servers.size(); i++) {
            if ((int) i == serverId) {
                config.SetReplicaPeer(i, server.GetCoordinator());
                continue;
            }
            peers.emplace_back(new ReplicationKVClient(servers[i].Name, servers[i].Port, i));
            config.SetReplicaPeer(i, peers.back().get());
        }

        fprintf(stdout, "KVServerProgram:RUN! server %d of %d, %d replicas per shard\n",
                serverId, config.NumServers(), numReplicasPerShard);
        server.Run(servers[serverId].Port);
    } catch (KVOperationException &e) {
        fprintf(stdout, "KVOperationException: %s\n", e.what());
        exit(1);
    } catch (SocketException &e) {
        fprintf(stdout, "SocketException: %s\n", e.what());
        exit(1);
    }
}
