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

#ifndef SKV_RPC_NETWORK_H
#define SKV_RPC_NETWORK_H

#include "rpc/rpc_id.h"
#include "messages/rpc_messages.pb.h"
#include <boost/utility.hpp>
#include <string>

namespace skv {

    // Server side of an RPC: decodes a request and fills in the reply.
    // Failures are reported in the reply status, never thrown.
    class RPCService {
    public:
        virtual ~RPCService() {
        }

        virtual void HandleRequest(const PbRpcRequest &request, PbRpcReply &reply) = 0;
    };

    // Client side of a connection to one server.
    class RPCEndpoint {
    public:
        virtual ~RPCEndpoint() {
        }

        // Throws RPCTimeoutException when the call does not complete, whether
        // the request or the reply got lost or the server refused it.
        virtual void Call(RPCMethod rid, const std::string &args, std::string &results) = 0;
    };

    // Named endpoints that can be pointed at a server and switched on and off.
    // Endpoints are owned by the network; a pointer returned by MakeEnd stays
    // valid until DeleteEnd is called with the same name.
    class Network {
    public:
        virtual ~Network() {
        }

        virtual RPCEndpoint *MakeEnd(const std::string &endName) = 0;

        virtual void Connect(const std::string &endName, int serverId) = 0;

        virtual void Enable(const std::string &endName, bool enabled) = 0;

        virtual void DeleteEnd(const std::string &endName) = 0;
    };

    // Deletes a network endpoint when leaving scope.
    class ScopedEnd : boost::noncopyable {
    public:

        ScopedEnd(Network *network, const std::string &endName)
                : _network(network),
                  _endName(endName),
                  _end(network->MakeEnd(endName)) {
        }

        ~ScopedEnd() {
            _network->DeleteEnd(_endName);
        }

        RPCEndpoint *operator->() {
            return _end;
        }

        const std::string &Name() const {
            return _endName;
        }

    private:
        Network *_network;
        std::string _endName;
        RPCEndpoint *_end;
    };

} // namespace skv

#endif
