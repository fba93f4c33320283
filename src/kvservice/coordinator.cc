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

#include "kvservice/coordinator.h"
#include "messages/rpc_messages.pb.h"
#include "rpc/rpc_id.h"
#include "common/sys_logger.h"
#include "common/sys_config.h"
#include "common/sys_stats.h"
#include "common/exceptions.h"
#include "common/utils.h"
#include <boost/format.hpp>
#include <thread>
#include <chrono>
#include <vector>

namespace skv {

    Coordinator::Coordinator(int serverId, ClusterConfig *config)
            : _serverId(serverId),
              _config(config),
              _forwardCounter(0) {
        if (serverId < 0 || serverId >= config->NumServers()) {
            throw KVOperationException((boost::format("Server id %d outside of a %d server cluster.")
                                        % serverId % config->NumServers()).str());
        }
    }

    Coordinator::~Coordinator() {
    }

    std::string Coordinator::Get(const std::string &key) {
        SysStats::NumPublicGetRequests += 1;

        if (!_config->Shards().IsResponsibleFor(_serverId, key)) {
            SysStats::NumRejectedGetRequests += 1;
            throw RPCTimeoutException((boost::format("Server %d holds no replica of shard %d.")
                                       % _serverId % _config->Shards().ShardOf(key)).str());
        }

        std::string value = _store.Get(key);
        _config->Op();
        return value;
    }

    void Coordinator::PutAppend(OpType op,
                                const std::string &key,
                                const std::string &value,
                                uint64_t clientId,
                                int64_t seq,
                                OpOutcome &outcome) {
        if (op == OpType::Append) {
            SysStats::NumPublicAppendRequests += 1;
        } else {
            SysStats::NumPublicPutRequests += 1;
        }

        if (!_config->Shards().IsPrimaryFor(_serverId, key)) {
            Forward(op, key, value, clientId, seq, outcome);
            return;
        }

        if (!_store.Apply(op, key, value, clientId, seq, outcome)) {
            // duplicate, reply was cached by the original apply
            return;
        }
        _config->Op();

        SDEBUG((boost::format("Server %d applied %s %s seq %d client %d")
                % _serverId % (op == OpType::Append ? "Append" : "Put") % key % seq % clientId).str());

        Replicate(op, key, clientId, seq, outcome);
    }

    void Coordinator::Replicate(OpType op,
                                const std::string &key,
                                uint64_t clientId,
                                int64_t seq,
                                const OpOutcome &outcome) {
        ReplicatedUpdate update;
        update.Key = key;
        update.NewValue = outcome.NewValue;
        update.ClientId = clientId;
        update.Seq = seq;
        update.HasReply = outcome.HasReply;
        update.Reply = outcome.Reply;
        update.Op = op;

        std::vector<int> backups = _config->Shards().Backups(_config->Shards().ShardOf(key));
        for (unsigned int i = 0; i < backups.size(); i++) {
            int backupId = backups[i];
            if (backupId == _serverId) {
                continue;
            }

            ReplicaPeer *peer = _config->GetReplicaPeer(backupId);
            if (peer == NULL) {
                SLOG((boost::format("Server %d: no replica peer for backup %d, update of %s not replicated.")
                      % _serverId % backupId % key).str());
                SysStats::NumFailedUpdateReplications += 1;
                continue;
            }

            try {
                peer->ApplyReplicatedUpdate(update);
                SysStats::NumSentUpdates += 1;
            }
            catch (SocketException &e) {
                // only live backups are waited for
                SLOG((boost::format("Server %d: backup %d unreachable, update of %s skipped: %s")
                      % _serverId % backupId % key % e.what()).str());
                SysStats::NumFailedUpdateReplications += 1;
            }
            catch (RPCTimeoutException &e) {
                SLOG((boost::format("Server %d: backup %d timed out, update of %s skipped: %s")
                      % _serverId % backupId % key % e.what()).str());
                SysStats::NumFailedUpdateReplications += 1;
            }
            catch (KVOperationException &e) {
                SLOG((boost::format("Server %d: backup %d rejected update of %s: %s")
                      % _serverId % backupId % key % e.what()).str());
                SysStats::NumFailedUpdateReplications += 1;
            }
        }
    }

    bool Coordinator::ApplyReplicatedUpdate(const ReplicatedUpdate &update) {
        SysStats::NumRecvUpdateReplications += 1;
        return _store.ApplyReplicated(update);
    }

    void Coordinator::Forward(OpType op,
                              const std::string &key,
                              const std::string &value,
                              uint64_t clientId,
                              int64_t seq,
                              OpOutcome &outcome) {
        Network *net = _config->Net();
        int primary = _config->Shards().PrimaryFor(key);
        RPCMethod method = (op == OpType::Append) ? RPCMethod::Append : RPCMethod::Put;

        PbRpcKVPutAppendArg args;
        args.set_key(key);
        args.set_value(value);
        args.set_clientid(clientId);
        args.set_seq(seq);
        std::string serializedArgs = args.SerializeAsString();

        SysStats::NumForwardedRequests += 1;

        std::chrono::steady_clock::time_point deadline =
                std::chrono::steady_clock::now() + std::chrono::milliseconds(SysConfig::ForwardTimeout);

        while (std::chrono::steady_clock::now() < deadline) {
            std::string endName = (boost::format("fwd-%d-%d-%08x")
                                   % _serverId % (++_forwardCounter) % Utils::Rand32()).str();

            try {
                ScopedEnd end(net, endName);
                net->Connect(endName, primary);
                net->Enable(endName, _config->IsRunning(primary));

                std::string serializedResult;
                end->Call(method, serializedArgs, serializedResult);

                PbRpcKVPutAppendResult result;
                if (!result.ParseFromString(serializedResult)) {
                    throw KVOperationException("Malformed PutAppend result.");
                }
                outcome.HasReply = result.has_value();
                outcome.Reply = result.value();
                return;
            }
            catch (RPCTimeoutException &e) {
                SDEBUG((boost::format("Server %d: forward of %s to %d failed: %s")
                        % _serverId % key % primary % e.what()).str());
            }

            SysStats::NumForwardRetries += 1;
            std::this_thread::sleep_for(std::chrono::milliseconds(SysConfig::ForwardRetryInterval));
        }

        SLOG((boost::format("Server %d: giving up forwarding %s of %s to primary %d.")
              % _serverId % getTextForEnum(method) % key % primary).str());
        throw RPCTimeoutException((boost::format("Forwarding to primary %d timed out.") % primary).str());
    }

    bool Coordinator::ShowItem(const std::string &key, std::string &itemStr) {
        return _store.ShowItem(key, itemStr);
    }

    bool Coordinator::ShowState(std::string &stateStr) {
        stateStr += (boost::format("SERVER_ID %d\n"
                                   "NUM_SERVERS %d\n"
                                   "NUM_REPLICAS_PER_SHARD %d\n"
                                   "NUM_KEYS %d\n"
                                   "NUM_CLIENTS %d\n")
                     % _serverId
                     % _config->NumServers()
                     % _config->NumReplicasPerShard()
                     % _store.Size()
                     % _store.NumClients()).str();
        stateStr += SysStats::ToString();
        return true;
    }

} // namespace skv
