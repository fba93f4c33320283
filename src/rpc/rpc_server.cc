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

#include "rpc/rpc_server.h"
#include "common/sys_logger.h"
#include <boost/format.hpp>

namespace skv {

    RPCServer::RPCServer(TCPSocket *socket, RPCService *service)
            : _mc(socket),
              _service(service),
              _numServed(0) {
    }

    int64_t RPCServer::Serve() {
        try {
            for (;;) {
                PbRpcRequest request;
                _mc.Recv(request);

                PbRpcReply reply;
                _service->HandleRequest(request, reply);

                _mc.Send(reply);
                _numServed += 1;
            }
        } catch (SocketException &e) {
            // a closed peer ends the loop like any other socket error
            SDEBUG((boost::format("Connection closed after %d requests: %s") % _numServed % e.what()).str());
        }
        return _numServed;
    }

    void RPCServer::Shutdown() {
        _mc.Shutdown();
    }

}
