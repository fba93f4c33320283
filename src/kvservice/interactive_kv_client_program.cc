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

#include "kvservice/clerk.h"
#include "kvservice/shard_map.h"
#include "rpc/tcp_network.h"
#include "common/exceptions.h"
#include "common/sys_config.h"
#include "common/utils.h"
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <string>
#include <vector>
#include <stdlib.h>
#include <iostream>

using namespace skv;

void showUsage();

bool showState(std::vector<RPCEndpoint *> &ends, int serverId, std::string &stateStr);

bool showItem(std::vector<RPCEndpoint *> &ends, int serverId, const std::string &key, std::string &itemStr);

int main(int argc, char *argv[]) {

    if (argc != 3 && argc != 4) {
        fprintf(stdout, "Usage: %s <NumReplicasPerShard> <ServerList: host1:port1,host2:port2,...>\n", argv[0]);
        fprintf(stdout, "Usage: %s <NumReplicasPerShard> <ServerList: host1:port1,host2:port2,...> <command>\n",
                argv[0]);
        fprintf(stdout, "Found %d args\n", argc);
        exit(1);
    }

    SysConfig::SysLogEchoToConsole = false;
    int numReplicasPerShard = atoi(argv[1]);

    try {
        std::vector<ServerAddress> servers = Utils::str2servers(argv[2]);
        ShardMap shardMap(servers.size(), numReplicasPerShard);

        // one endpoint per server
        TCPNetwork network(servers);
        std::vector<RPCEndpoint *> ends;
        for (unsigned int i = 0; i < servers.size(); i++) {
            std::string endName = (boost::format("clerk-%d") % i).str();
            ends.push_back(network.MakeEnd(endName));
            network.Connect(endName, i);
            network.Enable(endName, true);
        }

        Clerk clerk(ends, shardMap);
        do {
            std::string input;

            if (argc == 4) {
                input = argv[3];
            } else {
                std::cout << ">"; // wait for user input
                if (!std::getline(std::cin, input)) {
                    break;
                }
            }

            std::vector<std::string> splitedInput;
            boost::split(splitedInput, input, boost::is_any_of(" "), boost::token_compress_on);
            bool inputInvalid = true;

            try {
                if (splitedInput[0] == "Get") {
                    if (splitedInput.size() == 2) {
                        std::string key = splitedInput[1];
                        std::string getValue = clerk.Get(key);
                        std::cout << "Got " << key << " = " << getValue << "\n";
                        inputInvalid = false;
                    }
                } else if (splitedInput[0] == "Check") {
                    if (splitedInput.size() == 3) {
                        std::string key = splitedInput[1];
                        std::string expectedValue = splitedInput[2];
                        std::string getValue = clerk.Get(key);
                        if (expectedValue == getValue) {
                            std::cout << "[OK] " << key << " == " << getValue << std::endl;
                        } else {
                            std::cout << "ERROR! Expected [" << expectedValue << "] but found [" << getValue << "]"
                                      << std::endl;
                        }
                        inputInvalid = false;
                    }
                } else if (splitedInput[0] == "Put") {
                    if (splitedInput.size() == 3) {
                        std::string key = splitedInput[1];
                        std::string value = splitedInput[2];
                        clerk.Put(key, value);
                        std::cout << "Assigned " << key << " = " << value << std::endl;
                        inputInvalid = false;
                    }
                } else if (splitedInput[0] == "Append") {
                    if (splitedInput.size() == 3) {
                        std::string key = splitedInput[1];
                        std::string value = splitedInput[2];
                        std::string previous = clerk.Append(key, value);
                        std::cout << "Appended " << value << " to " << key << " (was [" << previous << "])"
                                  << std::endl;
                        inputInvalid = false;
                    }
                } else if (splitedInput[0] == "ShowState") {
                    if (splitedInput.size() == 2) {
                        int serverId = atoi(splitedInput[1].c_str());
                        std::string stateStr;
                        if (serverId >= 0 && serverId < (int) ends.size() && showState(ends, serverId, stateStr)) {
                            std::cout << stateStr << "\n";
                        } else {
                            std::cout << "Operation failed.\n";
                        }
                        inputInvalid = false;
                    }
                } else if (splitedInput[0] == "ShowItem") {
                    if (splitedInput.size() == 3) {
                        int serverId = atoi(splitedInput[1].c_str());
                        std::string itemStr;
                        if (serverId >= 0 && serverId < (int) ends.size() &&
                            showItem(ends, serverId, splitedInput[2], itemStr)) {
                            std::cout << itemStr << "\n";
                        } else {
                            std::cout << "Operation failed.\n";
                        }
                        inputInvalid = false;
                    }
                } else if (splitedInput[0] == "Quit") {
                    break;
                }
            } catch (RPCTimeoutException &e) {
                std::cout << "Operation failed.\n";
                inputInvalid = false;
            } catch (KVOperationException &e) {
                std::cout << "Operation failed: " << e.what() << "\n";
                inputInvalid = false;
            }

            if (inputInvalid) {
                std::cout << "Invalid input.\n";
                showUsage();
            }
        } while (argc == 3);

    } catch (KVOperationException &e) {
        fprintf(stdout, "KVOperationException: %s\n", e.what());
        exit(1);
    }

}

bool showState(std::vector<RPCEndpoint *> &ends, int serverId, std::string &stateStr) {
    std::string serializedResult;
    ends[serverId]->Call(RPCMethod::ShowState, "", serializedResult);

    PbRpcKVShowResult result;
    if (!result.ParseFromString(serializedResult) || !result.succeeded()) {
        return false;
    }
    stateStr = result.returnstring();
    return true;
}

bool showItem(std::vector<RPCEndpoint *> &ends, int serverId, const std::string &key, std::string &itemStr) {
    PbRpcKVShowArg arg;
    arg.set_key(key);
    std::string serializedResult;
    ends[serverId]->Call(RPCMethod::ShowItem, arg.SerializeAsString(), serializedResult);

    PbRpcKVShowResult result;
    if (!result.ParseFromString(serializedResult) || !result.succeeded()) {
        return false;
    }
    itemStr = result.returnstring();
    return true;
}

void showUsage() {
    std::string usage = "Get <key>\n"
            "Put <key> <value>\n"
            "Append <key> <value>\n"
            "Check <key> <expected value>\n"
            "ShowState <server id>\n"
            "ShowItem <server id> <key>\n"
            "Quit\n";
    fprintf(stdout, "%s", usage.c_str());
}
