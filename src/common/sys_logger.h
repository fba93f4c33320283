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

#ifndef SKV_COMMON_SYS_LOGGER_H
#define SKV_COMMON_SYS_LOGGER_H

#include "common/sys_config.h"
#include <boost/utility.hpp>
#include <boost/format.hpp>
#include <string>
#include <mutex>
#include <stdio.h>

namespace skv {

    class SysLogger : boost::noncopyable {
    public:
        static SysLogger *Instance();

        ~SysLogger();

        void Log(const std::string &msg, const char *file, int line);

        void Debug(const std::string &msg, const char *file, int line);

    private:
        SysLogger();

        void Write(const char *level, const std::string &msg, const char *file, int line);

        std::mutex _mutex;
        FILE *_logFile;
    };

#define SLOG(A) skv::SysLogger::Instance()->Log((A), __FILE__, __LINE__)

#define SDEBUG(A) do {\
                    if (skv::SysConfig::Debugging) {\
                        skv::SysLogger::Instance()->Debug((A), __FILE__, __LINE__);\
                    }\
                  } while (0)

} // namespace skv

#endif
