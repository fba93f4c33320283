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

#include "kvservice/replication_kv_client.h"
#include "messages/rpc_messages.pb.h"
#include "common/sys_config.h"
#include "common/sys_stats.h"
#include "common/sys_logger.h"
#include "common/exceptions.h"


namespace skv {

  ReplicationKVClient::ReplicationKVClient(std::string serverName, int serverPort, int backupId)
  : _serverName(serverName),
  _serverPort(serverPort),
  _backupId(backupId) {
    _rpcClient = new SyncRPCClient(_serverName, _serverPort);
  }

  ReplicationKVClient::~ReplicationKVClient() {
    delete _rpcClient;
  }

  bool ReplicationKVClient::ApplyReplicatedUpdate(const ReplicatedUpdate& update) {
    PbRpcReplicationArg opArg;
    opArg.set_key(update.Key);
    opArg.set_newvalue(update.NewValue);
    opArg.set_clientid(update.ClientId);
    opArg.set_seq(update.Seq);
    if (update.HasReply) {
      opArg.set_replyvalue(update.Reply);
    }
    opArg.set_op(update.Op == OpType::Append ? OP_APPEND : OP_PUT);

    std::string serializedArg = opArg.SerializeAsString();
    SysStats::NumSentReplicationBytes += serializedArg.size();

    SDEBUG((boost::format("Replicating %s seq %d to backup %d at %s:%d")
            % update.Key % update.Seq % _backupId % _serverName % _serverPort).str());

    // call server
    std::string serializedResult;
    _rpcClient->Call(RPCMethod::ReplicateUpdate, serializedArg, serializedResult);

    PbRpcReplicationResult opResult;
    if (!opResult.ParseFromString(serializedResult)) {
      throw KVOperationException("Malformed ReplicateUpdate result.");
    }
    return opResult.applied();
  }

}
