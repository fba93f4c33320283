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

#ifndef SKV_COMMON_EXCEPTIONS_H
#define SKV_COMMON_EXCEPTIONS_H

#include <exception>
#include <string>
#include <string.h>
#include <errno.h>

namespace skv {

    class SocketException : public std::exception {
    public:

        SocketException(const std::string &message, bool inclSysMsg = false) throw()
                : _userMessage(message) {
            if (inclSysMsg) {
                _userMessage.append(": ");
                _userMessage.append(strerror(errno));
            }
        }

        ~SocketException() throw() {
        }

        const char *what() const throw() {
            return _userMessage.c_str();
        }

    private:
        std::string _userMessage;
    };

    // Timeout-class failure. Raised for transport timeouts, for a Get sent to a
    // node that does not replicate the key, and when a retry deadline runs out.
    class RPCTimeoutException : public std::exception {
    public:

        RPCTimeoutException(const std::string &message) throw()
                : _message(message) {
        }

        ~RPCTimeoutException() throw() {
        }

        const char *what() const throw() {
            return _message.c_str();
        }

    private:
        std::string _message;
    };

    class KVOperationException : public std::exception {
    public:

        KVOperationException(const std::string &message) throw()
                : _message(message) {
        }

        ~KVOperationException() throw() {
        }

        const char *what() const throw() {
            return _message.c_str();
        }

    private:
        std::string _message;
    };

} // namespace skv

#endif
