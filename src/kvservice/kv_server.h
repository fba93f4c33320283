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

#ifndef SKV_KVSERVICE_KV_SERVER_H
#define SKV_KVSERVICE_KV_SERVER_H

#include "common/types.h"
#include "kvservice/coordinator.h"
#include "kvservice/cluster_config.h"
#include "rpc/network.h"
#include "rpc/socket.h"
#include "rpc/rpc_server.h"
#include "messages/rpc_messages.pb.h"
#include <boost/utility.hpp>
#include <condition_variable>
#include <unordered_set>
#include <atomic>
#include <mutex>

namespace skv {

    // RPC front-end of a storage node. Requests arrive either through
    // HandleRequest (in-process networks) or over TCP once Listen/Serve run.
    class KVServer : public RPCService, boost::noncopyable {
    public:
        KVServer(int serverId, ClusterConfig *config);

        ~KVServer();

        void HandleRequest(const PbRpcRequest &request, PbRpcReply &reply);

        // Binds the public port, 0 picks a free one. Returns the bound port.
        unsigned short Listen(unsigned short publicPort);

        // Accepts connections until Stop is called.
        void Serve();

        void Run(unsigned short publicPort);

        // Closes the listening socket and all connections, and waits for the
        // connection threads to finish.
        void Stop();

        Coordinator *GetCoordinator() {
            return _coordinator;
        }

        int ServerId() const {
            return _serverId;
        }

    private:
        int _serverId;
        Coordinator *_coordinator;

        TCPServerSocket *_serverSocket;
        std::atomic<bool> _stopped;
        std::mutex _connMutex;
        std::condition_variable _connCv;
        int _activeThreads;
        std::unordered_set<RPCServer *> _connections;

    private:
        void HandlePublicRequest(TCPSocket *clientSocket);

        void processPublicRequest(const PbRpcRequest &rpcRequest, PbRpcReply &rpcReply);

        void HandleGet(PbRpcKVGetArg &opArg, PbRpcKVGetResult &opResult);

        void HandlePutAppend(OpType op, PbRpcKVPutAppendArg &opArg, PbRpcKVPutAppendResult &opResult);

        void HandleReplicateUpdate(PbRpcReplicationArg &opArg, PbRpcReplicationResult &opResult);
    };

} // namespace skv

#endif
