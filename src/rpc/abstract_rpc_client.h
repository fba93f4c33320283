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

#ifndef SKV_RPC_ABSTRACT_RPC_CLIENT_H
#define SKV_RPC_ABSTRACT_RPC_CLIENT_H

#include "rpc/rpc_id.h"
#include "messages/rpc_messages.pb.h"
#include "common/exceptions.h"
#include <boost/format.hpp>
#include <atomic>
#include <stdint.h>

namespace skv {

    class AbstractRPCClient {
    public:

        AbstractRPCClient() : _msgIdCounter(0) {
        }

        virtual ~AbstractRPCClient() {
        }

    protected:

        int64_t GetMessageId() {
            return ++_msgIdCounter;
        }

        // Turns a failed reply status into the matching exception.
        static void CheckReply(RPCMethod rid, const PbRpcReply &reply) {
            switch (reply.status()) {
                case RPC_OK:
                    return;
                case RPC_TIMEOUT:
                    throw RPCTimeoutException((boost::format("%s: %s")
                                               % getTextForEnum(rid) % reply.errormessage()).str());
                default:
                    throw KVOperationException((boost::format("%s: %s")
                                                % getTextForEnum(rid) % reply.errormessage()).str());
            }
        }

    private:
        std::atomic<int64_t> _msgIdCounter;
    };

}

#endif
