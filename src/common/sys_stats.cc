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

#include "common/sys_stats.h"
#include <boost/format.hpp>

namespace skv {
    std::atomic<int> SysStats::NumPublicGetRequests(0);
    std::atomic<int> SysStats::NumPublicPutRequests(0);
    std::atomic<int> SysStats::NumPublicAppendRequests(0);

    std::atomic<int> SysStats::NumRejectedGetRequests(0);
    std::atomic<int> SysStats::NumForwardedRequests(0);
    std::atomic<int> SysStats::NumForwardRetries(0);
    std::atomic<int> SysStats::NumDuplicateRequests(0);

    std::atomic<int> SysStats::NumSentUpdates(0);
    std::atomic<int> SysStats::NumFailedUpdateReplications(0);
    std::atomic<int> SysStats::NumRecvUpdateReplications(0);
    std::atomic<int> SysStats::NumSentReplicationBytes(0);

    std::string SysStats::ToString() {
        return (boost::format("GET %d\n"
                              "PUT %d\n"
                              "APPEND %d\n"
                              "REJECTED_GET %d\n"
                              "FORWARDED %d\n"
                              "FORWARD_RETRIES %d\n"
                              "DUPLICATES %d\n"
                              "SENT_UPDATES %d\n"
                              "FAILED_UPDATES %d\n"
                              "RECV_UPDATES %d\n"
                              "SENT_REPLICATION_BYTES %d\n")
                % NumPublicGetRequests.load()
                % NumPublicPutRequests.load()
                % NumPublicAppendRequests.load()
                % NumRejectedGetRequests.load()
                % NumForwardedRequests.load()
                % NumForwardRetries.load()
                % NumDuplicateRequests.load()
                % NumSentUpdates.load()
                % NumFailedUpdateReplications.load()
                % NumRecvUpdateReplications.load()
                % NumSentReplicationBytes.load()).str();
    }

}
