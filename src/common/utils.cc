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

#include "common/utils.h"
#include "common/exceptions.h"
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <time.h>
#include <stdlib.h>
#include <unistd.h>
#include <libgen.h>
#include <sys/param.h>
#include <sys/syscall.h>
#include <mutex>
#include <random>

namespace skv {

    static std::mutex RandomMutex;

    static std::mt19937_64 &RandomEngine() {
        static std::mt19937_64 engine(std::random_device{}());
        return engine;
    }

    std::string Utils::GetHostName() {
        // max length of hostname decided at kernel compilation time
        char buf[128];
        if (gethostname(buf, sizeof(buf)) < 0) {
            return "unknown";
        }
        buf[sizeof(buf) - 1] = '\0';
        return std::string(buf);
    }

    std::string Utils::GetCurrentExecFileName() {
        char buf[MAXPATHLEN];
        ssize_t len = readlink("/proc/self/exe", buf, MAXPATHLEN - 1);
        if (len <= 0) {
            return "unknown";
        }
        buf[len] = '\0';
        return std::string(basename(buf));
    }

    unsigned int Utils::GetThreadId() {
        return (unsigned int) syscall(SYS_gettid);
    }

    double Utils::RandomDouble() {
        std::uniform_real_distribution<double> uniform(0.0, 1.0);
        std::lock_guard<std::mutex> lk(RandomMutex);
        return uniform(RandomEngine());
    }

    uint32_t Utils::Rand32() {
        std::lock_guard<std::mutex> lk(RandomMutex);
        return static_cast<uint32_t>(RandomEngine()() & 0xFFFFFFFFULL);
    }

    uint64_t Utils::NRand() {
        std::lock_guard<std::mutex> lk(RandomMutex);
        return RandomEngine()() & ((1ULL << 62) - 1);
    }

    PhysicalTimeSpec Utils::GetCurrentClockTime() {
        PhysicalTimeSpec pts;
        timespec ts;

        clock_gettime(CLOCK_REALTIME, &ts);
        pts.Seconds = ts.tv_sec;

        pts.NanoSeconds = ts.tv_nsec;
        return pts;
    }

    std::string Utils::physicaltime2str(const PhysicalTimeSpec &time) {
        return (boost::format("%d.%06d") % time.Seconds % (time.NanoSeconds / 1000)).str();
    }

    std::vector<ServerAddress> Utils::str2servers(const std::string &str) {
        std::vector<std::string> entries;
        std::vector<ServerAddress> servers;

        boost::split(entries, str, boost::is_any_of(","), boost::token_compress_on);
        for (unsigned int i = 0; i < entries.size(); i++) {
            std::string entry = boost::trim_copy(entries[i]);
            if (entry.empty()) {
                continue;
            }

            std::vector<std::string> hostPort;
            boost::split(hostPort, entry, boost::is_any_of(":"));
            if (hostPort.size() != 2 || hostPort[0].empty()) {
                throw KVOperationException((boost::format("Malformed server address '%s'.") % entry).str());
            }

            int port = atoi(hostPort[1].c_str());
            if (port <= 0 || port > 65535) {
                throw KVOperationException((boost::format("Invalid port in '%s'.") % entry).str());
            }

            servers.push_back(ServerAddress(hostPort[0], port, servers.size()));
        }

        return servers;
    }

} // namespace skv
