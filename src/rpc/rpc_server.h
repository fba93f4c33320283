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

#ifndef SKV_RPC_RPC_SERVER_H
#define SKV_RPC_RPC_SERVER_H

#include "rpc/socket.h"
#include "rpc/network.h"
#include "rpc/message_channel.h"
#include "messages/rpc_messages.pb.h"
#include <boost/utility.hpp>
#include <memory>
#include <stdint.h>

namespace skv {

    // Serves one accepted connection: requests are read off the socket,
    // handed to the service and answered in arrival order.
    class RPCServer : boost::noncopyable {
    public:
        // Takes ownership of socket.
        RPCServer(TCPSocket *socket, RPCService *service);

        // Runs until the peer hangs up or Shutdown is called. Returns the
        // number of requests answered.
        int64_t Serve();

        // Unblocks Serve from another thread.
        void Shutdown();

        int64_t NumServed() const {
            return _numServed;
        }

    private:
        MessageChannel _mc;
        RPCService *_service;
        int64_t _numServed;
    };

    typedef std::shared_ptr<RPCServer> RPCServerPtr;

}

#endif
