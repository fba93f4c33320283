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

#include "common/sys_logger.h"
#include "common/sys_config.h"
#include "common/utils.h"
#include "common/types.h"
#include "common/exceptions.h"
#include "kvservice/kv_server.h"
#include "rpc/rpc_id.h"
#include <boost/format.hpp>
#include <thread>

namespace skv {

    KVServer::KVServer(int serverId, ClusterConfig *config)
            : _serverId(serverId),
              _coordinator(new Coordinator(serverId, config)),
              _serverSocket(NULL),
              _stopped(false),
              _activeThreads(0) {
    }

    KVServer::~KVServer() {
        Stop();
        delete _coordinator;
    }

    void KVServer::HandleRequest(const PbRpcRequest &request, PbRpcReply &reply) {
        reply.set_msgid(request.msgid());

        try {
            processPublicRequest(request, reply);
            reply.set_status(RPC_OK);
        }
        catch (RPCTimeoutException &e) {
            reply.clear_results();
            reply.set_status(RPC_TIMEOUT);
            reply.set_errormessage(e.what());
        }
        catch (KVOperationException &e) {
            SLOG((boost::format("Server %d: %s failed: %s")
                  % _serverId % getTextForEnum(static_cast<RPCMethod>(request.methodid())) % e.what()).str());
            reply.clear_results();
            reply.set_status(RPC_FAILED);
            reply.set_errormessage(e.what());
        }
    }

    void KVServer::processPublicRequest(const PbRpcRequest &rpcRequest, PbRpcReply &rpcReply) {
        switch (static_cast<RPCMethod> (rpcRequest.methodid())) {
            ////////////////////////////////
            // key-value store interface  //
            ////////////////////////////////

            case RPCMethod::Get: {
                // get arguments
                PbRpcKVGetArg opArg;
                PbRpcKVGetResult opResult;
                if (!opArg.ParseFromString(rpcRequest.arguments())) {
                    throw KVOperationException("Malformed Get arguments.");
                }

                HandleGet(opArg, opResult);

                rpcReply.set_results(opResult.SerializeAsString());
                break;
            }

            case RPCMethod::Put:
            case RPCMethod::Append: {
                // get arguments
                PbRpcKVPutAppendArg opArg;
                PbRpcKVPutAppendResult opResult;
                if (!opArg.ParseFromString(rpcRequest.arguments())) {
                    throw KVOperationException("Malformed PutAppend arguments.");
                }

                OpType op = static_cast<RPCMethod> (rpcRequest.methodid()) == RPCMethod::Append ?
                            OpType::Append : OpType::Put;
                HandlePutAppend(op, opArg, opResult);

                rpcReply.set_results(opResult.SerializeAsString());
                break;
            }

            ////////////////////////////////
            // replication                //
            ////////////////////////////////

            case RPCMethod::ReplicateUpdate: {
                PbRpcReplicationArg opArg;
                PbRpcReplicationResult opResult;
                if (!opArg.ParseFromString(rpcRequest.arguments())) {
                    throw KVOperationException("Malformed ReplicateUpdate arguments.");
                }

                HandleReplicateUpdate(opArg, opResult);

                rpcReply.set_results(opResult.SerializeAsString());
                break;
            }

            case RPCMethod::ShowState: {
                PbRpcKVShowResult opResult;
                // execute op
                std::string stateStr = (boost::format("*%s|\n") % Utils::GetHostName()).str();
                bool ret = _coordinator->ShowState(stateStr);
                opResult.set_succeeded(ret);
                if (ret) {
                    opResult.set_returnstring(stateStr);
                }

                rpcReply.set_results(opResult.SerializeAsString());
                break;
            }

            case RPCMethod::ShowItem: {
                PbRpcKVShowArg opArg;
                PbRpcKVShowResult opResult;
                if (!opArg.ParseFromString(rpcRequest.arguments())) {
                    throw KVOperationException("Malformed ShowItem arguments.");
                }

                std::string itemStr;
                bool ret = _coordinator->ShowItem(opArg.key(), itemStr);
                opResult.set_succeeded(ret);
                if (ret) {
                    opResult.set_returnstring(itemStr);
                }

                rpcReply.set_results(opResult.SerializeAsString());
                break;
            }

            default:
                throw KVOperationException("(public) Unsupported operation.");
        }
    }

    void KVServer::HandleGet(PbRpcKVGetArg &opArg, PbRpcKVGetResult &opResult) {
        opResult.set_value(_coordinator->Get(opArg.key()));
    }

    void KVServer::HandlePutAppend(OpType op, PbRpcKVPutAppendArg &opArg, PbRpcKVPutAppendResult &opResult) {
        OpOutcome outcome;

        _coordinator->PutAppend(op, opArg.key(), opArg.value(), opArg.clientid(), opArg.seq(), outcome);

        if (outcome.HasReply) {
            opResult.set_value(outcome.Reply);
        }
    }

    void KVServer::HandleReplicateUpdate(PbRpcReplicationArg &opArg, PbRpcReplicationResult &opResult) {
        ReplicatedUpdate update;
        update.Key = opArg.key();
        update.NewValue = opArg.newvalue();
        update.ClientId = opArg.clientid();
        update.Seq = opArg.seq();
        update.HasReply = opArg.has_replyvalue();
        update.Reply = opArg.replyvalue();
        update.Op = opArg.op() == OP_APPEND ? OpType::Append : OpType::Put;

        opResult.set_applied(_coordinator->ApplyReplicatedUpdate(update));
    }

    ////////////////////////////////
    // TCP serving                //
    ////////////////////////////////

    unsigned short KVServer::Listen(unsigned short publicPort) {
        std::lock_guard<std::mutex> lk(_connMutex);

        if (_serverSocket != NULL) {
            throw KVOperationException("Server is already listening.");
        }
        _serverSocket = new TCPServerSocket(publicPort);
        _stopped = false;

        unsigned short port = _serverSocket->getLocalPort();
        SLOG((boost::format("Server %d listening on port %d.") % _serverId % port).str());
        return port;
    }

    void KVServer::Serve() {
        TCPServerSocket *serverSocket;
        {
            std::lock_guard<std::mutex> lk(_connMutex);
            if (_serverSocket == NULL) {
                if (_stopped) {
                    return;
                }
                throw KVOperationException("Serve called before Listen.");
            }
            serverSocket = _serverSocket;
            _activeThreads += 1;
        }

        while (!_stopped) {
            TCPSocket *clientSocket = NULL;
            try {
                clientSocket = serverSocket->accept();
            } catch (SocketException &e) {
                if (!_stopped) {
                    SLOG((boost::format("Server %d public socket exception: %s") % _serverId % e.what()).str());
                }
                break;
            }

            {
                std::lock_guard<std::mutex> lk(_connMutex);
                if (_stopped) {
                    delete clientSocket;
                    break;
                }
                _activeThreads += 1;
            }

            std::thread t(&KVServer::HandlePublicRequest, this, clientSocket);
            t.detach();
        }

        std::lock_guard<std::mutex> lk(_connMutex);
        _activeThreads -= 1;
        _connCv.notify_all();
    }

    void KVServer::Run(unsigned short publicPort) {
        Listen(publicPort);
        Serve();
    }

    void KVServer::Stop() {
        std::unique_lock<std::mutex> lk(_connMutex);

        if (_serverSocket == NULL) {
            return;
        }

        _stopped = true;
        _serverSocket->shutdown();
        for (auto it = _connections.begin(); it != _connections.end(); ++it) {
            (*it)->Shutdown();
        }

        while (_activeThreads > 0) {
            _connCv.wait(lk);
        }

        delete _serverSocket;
        _serverSocket = NULL;
    }

    void KVServer::HandlePublicRequest(TCPSocket *clientSocket) {
        RPCServerPtr rpcServer(new RPCServer(clientSocket, this));

        {
            std::lock_guard<std::mutex> lk(_connMutex);
            _connections.insert(rpcServer.get());
            if (_stopped) {
                rpcServer->Shutdown();
            }
        }

        int64_t numServed = rpcServer->Serve();
        SDEBUG((boost::format("Server %d: client connection done, %d requests served.")
                % _serverId % numServed).str());

        std::lock_guard<std::mutex> lk(_connMutex);
        _connections.erase(rpcServer.get());
        _activeThreads -= 1;
        _connCv.notify_all();
    }

} // namespace skv
