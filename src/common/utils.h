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

#ifndef SKV_COMMON_UTILS_H
#define SKV_COMMON_UTILS_H

#include "common/types.h"
#include <string>
#include <vector>
#include <stdint.h>

namespace skv {

    class Utils {
    public:
        static std::string GetHostName();

        static std::string GetCurrentExecFileName();

        static unsigned int GetThreadId();

        // uniformly random in [0, 1)
        static double RandomDouble();

        static uint32_t Rand32();

        // 62-bit random identifier
        static uint64_t NRand();

        static PhysicalTimeSpec GetCurrentClockTime();

        static std::string physicaltime2str(const PhysicalTimeSpec &time);

        // "host1:port1,host2:port2,..." -> addresses numbered in list order
        static std::vector<ServerAddress> str2servers(const std::string &str);
    };

} // namespace skv

#endif
