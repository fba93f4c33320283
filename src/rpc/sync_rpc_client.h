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

#ifndef SKV_RPC_SYNC_RPC_CLIENT_H
#define SKV_RPC_SYNC_RPC_CLIENT_H

#include "rpc/abstract_rpc_client.h"
#include "rpc/message_channel.h"
#include "messages/rpc_messages.pb.h"
#include "common/exceptions.h"
#include <string>
#include <mutex>

namespace skv {

    // Blocking request/reply client over one TCP connection. The connection
    // is opened on first use and reopened on the call after a failure.
    class SyncRPCClient : public AbstractRPCClient {
    public:
        SyncRPCClient(std::string host, int port);

        // Throws SocketException when the server cannot be reached or does not
        // answer within SysConfig::RPCTimeout, RPCTimeoutException or
        // KVOperationException when the server reports a failure.
        void Call(RPCMethod rid, const std::string &args, std::string &results);

        const std::string &Host() const {
            return _host;
        }

        int Port() const {
            return _port;
        }

    private:
        MessageChannelPtr _msgChannel;
        std::string _host;
        int _port;
        std::mutex _callMutex;

        void _Call(RPCMethod rid, const std::string &args, std::string &results);
    };

}

#endif
