//
// Created by moinshaikh on 2/14/26.
//

#include<memory>
#include<string>

#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Communication.hpp"

namespace MetaSac
{
    namespace Gym
    {
        Communicator::Communicator(const std::string &url, int timeoutMs)
        {
            context = std::make_unique<zmq::context_t>(1);
            socket = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pair);
            socket->set(zmq::sockopt::rcvtimeo, timeoutMs);

            socket->connect(url);
            spdlog::info("Connected to gym environment at: {}", url);
        }

        zmq::message_t Communicator::receive()
        {
            zmq::message_t message;
            auto received = socket->recv(message, zmq::recv_flags::none);
            if (!received)
            {
                throw std::runtime_error("Timeout waiting for response from gym server");
            }
            return message;
        }

        std::string Communicator::getRawResponse()
        {
            auto message = receive();
            return std::string(static_cast<const char *>(message.data()), message.size());
        }
    }
}
