#pragma once
/**
 * @file Communication.hpp
 * @brief ZeroMQ client for the gym server
 * @author moinshaikh
 * @date 2/14/26
 *
 * Requests are msgpack encoded and sent over a PAIR socket; every request is
 * answered by exactly one msgpack encoded response.
 */

#ifndef METASAC_COMMUNICATION_HPP
#define METASAC_COMMUNICATION_HPP

#include<cstring>
#include<sstream>
#include<memory>
#include<stdexcept>
#include<string>

#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Request.hpp"

namespace MetaSac
{
    namespace Gym
    {
        /**
         * @class Communicator
         * @brief Owns the ZeroMQ context and socket connected to one gym server
         */
        class Communicator
        {
        private:
            std::unique_ptr<zmq::context_t> context;
            std::unique_ptr<zmq::socket_t> socket;

            /** @throws std::runtime_error when no message arrives before the receive timeout */
            zmq::message_t receive();
        public:
            /**
             * @param url Server address, e.g. "tcp://127.0.0.1:10201"
             * @param timeoutMs Receive timeout in milliseconds
             */
            explicit Communicator(const std::string &url, int timeoutMs = 5000);

            std::string getRawResponse();

            /**
             * @brief Receives one response and converts it to `T`
             *
             * @throws std::runtime_error on timeout or when the message does not match `T`.
             */
            template <typename T>
            std::unique_ptr<T> getResponse()
            {
                auto packedMessage = receive();
                msgpack::object_handle objectHandle =
                    msgpack::unpack(static_cast<const char *>(packedMessage.data()), packedMessage.size());
                msgpack::object object = objectHandle.get();

                auto response = std::make_unique<T>();
                try
                {
                    object.convert(*response);
                }
                catch (const msgpack::type_error &error)
                {
                    std::ostringstream received;
                    received << object;
                    spdlog::error("Unexpected response from gym server: {}", received.str());
                    throw std::runtime_error(std::string("Malformed gym server response: ") + error.what());
                }
                return response;
            }

            template<class T>
            void sendRequest(const Request<T> &request)
            {
                msgpack::sbuffer buffer;
                msgpack::pack(buffer, request);

                zmq::message_t message(buffer.size());
                std::memcpy(message.data(), buffer.data(), buffer.size());
                socket->send(message, zmq::send_flags::none);
            }
        };
    }
}

#endif //METASAC_COMMUNICATION_HPP
