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

#ifndef SKV_COMMON_TYPES_H
#define SKV_COMMON_TYPES_H

#include <sys/types.h>
#include <string>
#include <vector>
#include <cstdint>
#include <inttypes.h>

namespace skv {

    class PhysicalTimeSpec {
    public:

        PhysicalTimeSpec() : Seconds(0), NanoSeconds(0) {
        }

        PhysicalTimeSpec(int64_t seconds, int64_t nanoSeconds)
                : Seconds(seconds),
                  NanoSeconds(nanoSeconds) {
        }

        int64_t Seconds;
        int64_t NanoSeconds;
    };

    class ServerAddress {
    public:

        ServerAddress()
                : Name("NULL"),
                  Port(-1),
                  ServerId(-1) {
        }

        ServerAddress(std::string name, int port, int serverId)
                : Name(name),
                  Port(port),
                  ServerId(serverId) {
        }

    public:
        std::string Name;
        int Port;
        int ServerId;
    };

    enum class OpType {
        Put = 1,
        Append
    };

    // Result of applying (or suppressing) one client mutation.
    class OpOutcome {
    public:

        OpOutcome() : HasReply(false) {
        }

        std::string NewValue;
        bool HasReply; // false for Put
        std::string Reply; // pre-append value for Append
    };

    // Dedup table entry: highest applied sequence of a client and its reply.
    class ClientOpRecord {
    public:

        ClientOpRecord() : Seq(0), HasReply(false) {
        }

        int64_t Seq;
        bool HasReply;
        std::string Reply;
    };

    // A mutation already decided by the primary, shipped to a backup.
    class ReplicatedUpdate {
    public:

        ReplicatedUpdate()
                : ClientId(0),
                  Seq(0),
                  HasReply(false),
                  Op(OpType::Put) {
        }

        std::string Key;
        std::string NewValue;
        uint64_t ClientId;
        int64_t Seq;
        bool HasReply;
        std::string Reply;
        OpType Op;
    };

} // namespace skv

#endif
