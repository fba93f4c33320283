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

#ifndef SKV_RPC_RPC_ID_H
#define SKV_RPC_RPC_ID_H

namespace skv {

    enum class RPCMethod {
        // key-value server
        Get = 1,
        Put,
        Append,

        // replication
        ReplicateUpdate,

        // diagnostics
        ShowState,
        ShowItem
    };

    static const char *RPCMethodS[] = {
            "KVServer.Get",
            "KVServer.Put",
            "KVServer.Append",

            "KVServer.ReplicateUpdate",

            "KVServer.ShowState",
            "KVServer.ShowItem"
    };

    static const int NumRPCMethods = sizeof(RPCMethodS) / sizeof(RPCMethodS[0]);

    inline const char *getTextForEnum(RPCMethod rid) {
        int i = ((int) rid) - 1;
        if (i < 0 || i >= NumRPCMethods) {
            return "Unknown";
        }
        return RPCMethodS[i];
    }

}

#endif
