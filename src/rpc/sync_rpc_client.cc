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

#include "rpc/sync_rpc_client.h"
#include "common/sys_config.h"
#include "common/sys_logger.h"

namespace skv {

    SyncRPCClient::SyncRPCClient(std::string host, int port)
            : AbstractRPCClient(),
              _host(host),
              _port(port) {
    }

    void SyncRPCClient::Call(RPCMethod rid, const std::string &args, std::string &results) {
        _Call(rid, args, results);
    }

    void SyncRPCClient::_Call(RPCMethod rid, const std::string &args, std::string &results) {
        PbRpcReply reply;

        {
            std::lock_guard<std::mutex> lk(_callMutex);

            try {
                if (!_msgChannel) {
                    _msgChannel = std::make_shared<MessageChannel>(_host, _port, SysConfig::RPCTimeout);
                }

                PbRpcRequest request;
                request.set_msgid(GetMessageId());
                request.set_methodid(static_cast<int32_t> (rid));
                request.set_arguments(args);

                _msgChannel->Send(request);

                _msgChannel->Recv(reply);

                if (reply.msgid() != request.msgid()) {
                    throw SocketException("Reply does not match request!", false);
                }
            }
            catch (SocketException &e) {
                SDEBUG((boost::format("[CALL FAILURE] %s %s:%d : %s")
                        % getTextForEnum(rid) % _host % _port % e.what()).str());

                // drop the connection, the next call reconnects
                _msgChannel.reset();
                throw;
            }
        }

        CheckReply(rid, reply);
        results = reply.results();
    }

} // namespace skv
