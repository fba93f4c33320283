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

#ifndef SKV_COMMON_SYS_CONFIG_H
#define SKV_COMMON_SYS_CONFIG_H

#include <string>

namespace skv {

    class SysConfig {
    public:
        // clerk
        static int ClerkRetryTimeout; // milliseconds
        static int ClerkRetryInterval; // milliseconds

        // forwarding from a non-primary to the primary
        static int ForwardTimeout; // milliseconds
        static int ForwardRetryInterval; // milliseconds

        // transport
        static int RPCTimeout; // milliseconds, TCP send/recv bound
        static int NetworkFailureDelay; // microseconds, simulated failure latency
        static double UnreliableDropRatio;

        // logging
        static std::string SysLogFilePrefix;
        static bool SysLogToFile;
        static bool SysLogEchoToConsole;
        static bool Debugging;
    };

} // namespace skv

#endif
