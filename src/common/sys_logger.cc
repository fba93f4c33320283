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

#include "common/sys_logger.h"
#include "common/utils.h"
#include <libgen.h>
#include <string.h>

namespace skv {

    SysLogger *SysLogger::Instance() {
        static SysLogger logger;
        return &logger;
    }

    SysLogger::SysLogger()
            : _logFile(NULL) {
        if (SysConfig::SysLogToFile) {
            std::string fileName = SysConfig::SysLogFilePrefix + Utils::GetCurrentExecFileName();
            _logFile = fopen(fileName.c_str(), "a");
            if (_logFile == NULL) {
                fprintf(stdout, "SysLogger: cannot open %s, logging to console only.\n", fileName.c_str());
                fflush(stdout);
            }
        }
    }

    SysLogger::~SysLogger() {
        if (_logFile != NULL) {
            fclose(_logFile);
        }
    }

    void SysLogger::Log(const std::string &msg, const char *file, int line) {
        Write("LOG", msg, file, line);
    }

    void SysLogger::Debug(const std::string &msg, const char *file, int line) {
        Write("DEBUG", msg, file, line);
    }

    void SysLogger::Write(const char *level, const std::string &msg, const char *file, int line) {
        // basename() may modify its argument
        char fileBuf[256];
        strncpy(fileBuf, file, sizeof(fileBuf) - 1);
        fileBuf[sizeof(fileBuf) - 1] = '\0';

        std::string entry = (boost::format("[%s] %s [%u] %s:%d %s\n")
                             % level
                             % Utils::physicaltime2str(Utils::GetCurrentClockTime())
                             % Utils::GetThreadId()
                             % basename(fileBuf)
                             % line
                             % msg).str();

        std::lock_guard<std::mutex> lk(_mutex);
        if (_logFile != NULL) {
            fputs(entry.c_str(), _logFile);
            fflush(_logFile);
        }
        if (SysConfig::SysLogEchoToConsole) {
            fputs(entry.c_str(), stdout);
            fflush(stdout);
        }
    }

} // namespace skv
