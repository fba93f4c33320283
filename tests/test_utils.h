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

#ifndef SKV_TESTS_TEST_UTILS_H
#define SKV_TESTS_TEST_UTILS_H

#include "kvservice/kv_server.h"
#include "kvservice/cluster_config.h"
#include "kvservice/clerk.h"
#include "rpc/local_network.h"
#include "common/sys_config.h"
#include <boost/format.hpp>
#include <boost/utility.hpp>
#include <string>
#include <vector>
#include <utility>

namespace skv {

    // Saves the tunables a test may shrink and puts them back afterwards.
    class ScopedSysConfig : boost::noncopyable {
    public:

        ScopedSysConfig()
                : _clerkRetryTimeout(SysConfig::ClerkRetryTimeout),
                  _clerkRetryInterval(SysConfig::ClerkRetryInterval),
                  _forwardTimeout(SysConfig::ForwardTimeout),
                  _forwardRetryInterval(SysConfig::ForwardRetryInterval),
                  _rpcTimeout(SysConfig::RPCTimeout),
                  _unreliableDropRatio(SysConfig::UnreliableDropRatio),
                  _echoToConsole(SysConfig::SysLogEchoToConsole) {
            SysConfig::SysLogEchoToConsole = false;
        }

        ~ScopedSysConfig() {
            SysConfig::ClerkRetryTimeout = _clerkRetryTimeout;
            SysConfig::ClerkRetryInterval = _clerkRetryInterval;
            SysConfig::ForwardTimeout = _forwardTimeout;
            SysConfig::ForwardRetryInterval = _forwardRetryInterval;
            SysConfig::RPCTimeout = _rpcTimeout;
            SysConfig::UnreliableDropRatio = _unreliableDropRatio;
            SysConfig::SysLogEchoToConsole = _echoToConsole;
        }

    private:
        int _clerkRetryTimeout;
        int _clerkRetryInterval;
        int _forwardTimeout;
        int _forwardRetryInterval;
        int _rpcTimeout;
        double _unreliableDropRatio;
        bool _echoToConsole;
    };

    // N servers on one LocalNetwork. Backups are replicated to by direct call
    // into their coordinators. Shutting a server down removes it from the
    // running set and cuts every link that leads to it.
    class KVTestCluster : boost::noncopyable {
    public:

        KVTestCluster(int numServers, int numReplicasPerShard)
                : _config(numServers, numReplicasPerShard, &_network),
                  _nextEnd(0) {
            for (int i = 0; i < numServers; i++) {
                KVServer *server = new KVServer(i, &_config);
                _servers.push_back(server);
                _network.AddServer(i, server);
                _config.SetReplicaPeer(i, server->GetCoordinator());
            }
        }

        ~KVTestCluster() {
            for (unsigned int i = 0; i < _clerks.size(); i++) {
                delete _clerks[i];
            }
            for (unsigned int i = 0; i < _servers.size(); i++) {
                _network.DeleteServer(i);
                _config.SetReplicaPeer(i, NULL);
            }
            for (unsigned int i = 0; i < _servers.size(); i++) {
                delete _servers[i];
            }
        }

        // A clerk with one endpoint per server, live only towards running servers.
        Clerk *MakeClerk() {
            std::vector<RPCEndpoint *> ends;
            for (int i = 0; i < NumServers(); i++) {
                ends.push_back(MakeEnd(i, _config.IsRunning(i)));
            }

            Clerk *clerk = new Clerk(ends, _config.Shards());
            _clerks.push_back(clerk);
            return clerk;
        }

        // A bare endpoint for hand-built RPCs.
        RPCEndpoint *MakeEnd(int serverId, bool enabled = true) {
            std::string endName = (boost::format("test-%d-%d") % (_nextEnd++) % serverId).str();
            RPCEndpoint *end = _network.MakeEnd(endName);
            _network.Connect(endName, serverId);
            _network.Enable(endName, enabled);
            _endTargets.push_back(std::make_pair(endName, serverId));
            return end;
        }

        void ShutdownServer(int serverId) {
            _config.SetRunning(serverId, false);
            _network.DeleteServer(serverId);
            EnableLinksTo(serverId, false);
        }

        void StartServer(int serverId) {
            _network.AddServer(serverId, _servers[serverId]);
            _config.SetRunning(serverId, true);
            EnableLinksTo(serverId, true);
        }

        // Reads a server's store directly, bypassing the network and op counting.
        std::string ValueAt(int serverId, const std::string &key) {
            return _servers[serverId]->GetCoordinator()->Store().Get(key);
        }

        KVServer *Server(int serverId) {
            return _servers[serverId];
        }

        int NumServers() const {
            return _servers.size();
        }

        LocalNetwork &Net() {
            return _network;
        }

        ClusterConfig &Config() {
            return _config;
        }

        const ShardMap &Shards() const {
            return _config.Shards();
        }

    private:
        void EnableLinksTo(int serverId, bool enabled) {
            for (unsigned int i = 0; i < _endTargets.size(); i++) {
                if (_endTargets[i].second == serverId) {
                    _network.Enable(_endTargets[i].first, enabled);
                }
            }
        }

        LocalNetwork _network;
        ClusterConfig _config;
        std::vector<KVServer *> _servers;
        std::vector<Clerk *> _clerks;
        std::vector<std::pair<std::string, int> > _endTargets;
        int _nextEnd;
    };

} // namespace skv

#endif
