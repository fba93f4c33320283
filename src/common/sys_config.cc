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

#include "common/sys_config.h"

namespace skv {

    int SysConfig::ClerkRetryTimeout = 2000;
    int SysConfig::ClerkRetryInterval = 50;

    int SysConfig::ForwardTimeout = 2000;
    int SysConfig::ForwardRetryInterval = 50;

    int SysConfig::RPCTimeout = 1000;
    int SysConfig::NetworkFailureDelay = 1000; // microseconds
    double SysConfig::UnreliableDropRatio = 0.1;

    std::string SysConfig::SysLogFilePrefix = "/tmp/syslog.txt.";
    bool SysConfig::SysLogToFile = true;
    bool SysConfig::SysLogEchoToConsole = true;
    bool SysConfig::Debugging = false;

} // namespace skv
