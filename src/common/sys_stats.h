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

#ifndef SKV_COMMON_SYS_STATS_H
#define SKV_COMMON_SYS_STATS_H

#include <atomic>
#include <string>

namespace skv {

    class SysStats {
    public:
        static std::atomic<int> NumPublicGetRequests;
        static std::atomic<int> NumPublicPutRequests;
        static std::atomic<int> NumPublicAppendRequests;

        static std::atomic<int> NumRejectedGetRequests;
        static std::atomic<int> NumForwardedRequests;
        static std::atomic<int> NumForwardRetries;
        static std::atomic<int> NumDuplicateRequests;

        static std::atomic<int> NumSentUpdates;
        static std::atomic<int> NumFailedUpdateReplications;
        static std::atomic<int> NumRecvUpdateReplications;
        static std::atomic<int> NumSentReplicationBytes;

        static std::string ToString();
    };

}

#endif
