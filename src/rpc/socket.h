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

#ifndef SKV_RPC_SOCKET_H
#define SKV_RPC_SOCKET_H

#include "common/exceptions.h"
#include <boost/utility.hpp>
#include <string>

namespace skv {

    class Socket : boost::noncopyable {
    public:
        ~Socket();

        unsigned short getLocalPort();

        // Unblocks any thread waiting on this socket.
        void shutdown();

    protected:
        Socket(int type, int protocol);

        Socket(int sockDesc);

        int _sockDesc;
    };

    class TCPSocket : public Socket {
    public:
        // Connects to host:port. Connect, send and receive are bounded by
        // timeoutMs when it is positive.
        TCPSocket(const std::string &host, unsigned short port, int timeoutMs = 0);

        // Wraps a socket returned by accept().
        TCPSocket(int newConnSD);

        int send(const void *buffer, int bufferLen);

        // Returns the number of bytes received, at least one. Throws when the
        // peer closed the connection or the receive timed out.
        int recv(void *buffer, int bufferLen);

    private:
        void setTimeout(int timeoutMs);
    };

    class TCPServerSocket : public Socket {
    public:
        // localPort 0 binds an ephemeral port, see getLocalPort().
        TCPServerSocket(unsigned short localPort, int queueLen = 64);

        TCPSocket *accept();
    };

} // namespace skv

#endif
