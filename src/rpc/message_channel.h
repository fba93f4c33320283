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

#ifndef SKV_RPC_MESSAGE_CHANNEL_H
#define SKV_RPC_MESSAGE_CHANNEL_H

#include "rpc/socket.h"
#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include <boost/utility.hpp>
#include <stdint.h>
#include <string.h>

namespace skv {

    // Frames protobuf messages on a TCP socket as
    // [length][length][serialized message]; the repeated length guards
    // against a desynchronized stream.
    class MessageChannel : boost::noncopyable {
    public:
        MessageChannel(std::string host, unsigned short port, int timeoutMs);

        MessageChannel(TCPSocket *socket);

        ~MessageChannel();

        template<class T> void Send(T &rpcMsg);

        template<class T> void Recv(T &rpcMsg);

        void Shutdown();

        // message length takes 4 bytes (32bit integer)
        static const int NumMsgLenBytes = sizeof(int32_t);

    private:
        void SendBytes(const uint8_t *buf, int len);

        void RecvBytes(uint8_t *buf, int len);

        std::string _host;
        unsigned short _port;
        TCPSocket *_socket;
        std::mutex _sendMutex;
        std::mutex _recvMutex;
        static const int32_t _MaxMessageSize = 64 * 1024 * 1024;
    };

    typedef std::shared_ptr<MessageChannel> MessageChannelPtr;

    template<class T> void MessageChannel::Send(T &rpcMsg) {
        int32_t msgLen = static_cast<int32_t>(rpcMsg.ByteSizeLong());

        std::vector<uint8_t> sendBuf(2 * NumMsgLenBytes + msgLen);

        // set message length
        memcpy(&sendBuf[0], &msgLen, NumMsgLenBytes);
        memcpy(&sendBuf[NumMsgLenBytes], &msgLen, NumMsgLenBytes);

        // serialize message
        if (msgLen > 0 && !rpcMsg.SerializeToArray(&sendBuf[2 * NumMsgLenBytes], msgLen)) {
            throw SocketException("Message serialization failed!", false);
        }

        {
            std::lock_guard<std::mutex> lk(_sendMutex);
            SendBytes(&sendBuf[0], sendBuf.size());
        }
    }

    template<class T> void MessageChannel::Recv(T &rpcMsg) {
        int32_t msgLen = 0;
        int32_t msgLen2 = 0;
        std::vector<uint8_t> recvBuf;

        {
            std::lock_guard<std::mutex> lk(_recvMutex);

            RecvBytes(reinterpret_cast<uint8_t *>(&msgLen), NumMsgLenBytes);
            RecvBytes(reinterpret_cast<uint8_t *>(&msgLen2), NumMsgLenBytes);

            if (msgLen != msgLen2) {
                throw SocketException("The msg lengths differ!", false);
            }
            if (msgLen < 0 || msgLen > _MaxMessageSize) {
                throw SocketException("Invalid msg length!", false);
            }

            recvBuf.resize(msgLen > 0 ? msgLen : 1);
            if (msgLen > 0) {
                RecvBytes(&recvBuf[0], msgLen);
            }
        }

        // deserialize message
        if (!rpcMsg.ParseFromArray(&recvBuf[0], msgLen)) {
            throw SocketException("Message parsing failed!", false);
        }
    }

}

#endif
