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

#include "rpc/socket.h"
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>

namespace skv {

    Socket::Socket(int type, int protocol) {
        if ((_sockDesc = socket(PF_INET, type, protocol)) < 0) {
            throw SocketException("Socket creation failed (socket())", true);
        }
    }

    Socket::Socket(int sockDesc)
            : _sockDesc(sockDesc) {
    }

    Socket::~Socket() {
        ::close(_sockDesc);
        _sockDesc = -1;
    }

    unsigned short Socket::getLocalPort() {
        sockaddr_in addr;
        socklen_t addrLen = sizeof(addr);

        if (getsockname(_sockDesc, (sockaddr *) &addr, &addrLen) < 0) {
            throw SocketException("Fetch of local port failed (getsockname())", true);
        }
        return ntohs(addr.sin_port);
    }

    void Socket::shutdown() {
        ::shutdown(_sockDesc, SHUT_RDWR);
    }

    TCPSocket::TCPSocket(const std::string &host, unsigned short port, int timeoutMs)
            : Socket(SOCK_STREAM, IPPROTO_TCP) {
        addrinfo hints;
        addrinfo *result = NULL;

        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        std::string service = std::to_string(port);
        if (getaddrinfo(host.c_str(), service.c_str(), &hints, &result) != 0 || result == NULL) {
            throw SocketException("Failed to resolve name (getaddrinfo())", false);
        }

        // SO_SNDTIMEO also bounds a blocking connect()
        if (timeoutMs > 0) {
            try {
                setTimeout(timeoutMs);
            } catch (SocketException &e) {
                freeaddrinfo(result);
                throw;
            }
        }

        int ret = ::connect(_sockDesc, result->ai_addr, result->ai_addrlen);
        freeaddrinfo(result);
        if (ret < 0) {
            if (errno == EINPROGRESS || errno == EAGAIN) {
                throw SocketException("Connect timeout", false);
            }
            throw SocketException("Connect failed (connect())", true);
        }

        int flag = 1;
        setsockopt(_sockDesc, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    }

    TCPSocket::TCPSocket(int newConnSD)
            : Socket(newConnSD) {
        int flag = 1;
        setsockopt(_sockDesc, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    }

    void TCPSocket::setTimeout(int timeoutMs) {
        timeval tv;
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;

        if (setsockopt(_sockDesc, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
            setsockopt(_sockDesc, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
            throw SocketException("Set timeout failed (setsockopt())", true);
        }
    }

    int TCPSocket::send(const void *buffer, int bufferLen) {
        int nsent = ::send(_sockDesc, buffer, bufferLen, MSG_NOSIGNAL);
        if (nsent < 0) {
            throw SocketException("Send failed (send())", true);
        }
        return nsent;
    }

    int TCPSocket::recv(void *buffer, int bufferLen) {
        int rtn = ::recv(_sockDesc, buffer, bufferLen, 0);
        if (rtn < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw SocketException("Receive timeout", false);
            }
            throw SocketException("Received failed (recv())", true);
        }
        if (rtn == 0) {
            throw SocketException("Connection closed by peer", false);
        }
        return rtn;
    }

    TCPServerSocket::TCPServerSocket(unsigned short localPort, int queueLen)
            : Socket(SOCK_STREAM, IPPROTO_TCP) {
        int flag = 1;
        setsockopt(_sockDesc, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));

        sockaddr_in localAddr;
        memset(&localAddr, 0, sizeof(localAddr));
        localAddr.sin_family = AF_INET;
        localAddr.sin_addr.s_addr = htonl(INADDR_ANY);
        localAddr.sin_port = htons(localPort);

        if (bind(_sockDesc, (sockaddr *) &localAddr, sizeof(localAddr)) < 0) {
            throw SocketException("Set of local port failed (bind())", true);
        }

        if (listen(_sockDesc, queueLen) < 0) {
            throw SocketException("Set listening socket failed (listen())", true);
        }
    }

    TCPSocket *TCPServerSocket::accept() {
        int newConnSD;
        if ((newConnSD = ::accept(_sockDesc, NULL, 0)) < 0) {
            throw SocketException("Accept failed (accept())", true);
        }

        return new TCPSocket(newConnSD);
    }

} // namespace skv
