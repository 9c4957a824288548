#pragma once
/**
 * @file Request.hpp
 * @brief Request and response structures exchanged with the gym server
 * @author moinshaikh
 * @date 2/14/26
 *
 * Every request is a msgpack map `{method, param}`. The server drives a single,
 * non-vectorised environment; observations are sent flattened.
 */

#ifndef METASAC_REQUEST_HPP
#define METASAC_REQUEST_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

#include<msgpack.hpp>

namespace MetaSac
{
    namespace Gym
    {
        /**
         * @brief Envelope of every request
         * @tparam T Parameter structure of the method
         */
        template<class T>
        struct Request
        {
            std::string method; ///< "make", "info", "reset" or "step"
            std::shared_ptr<T> param;

            Request(const std::string &method, std::shared_ptr<T> param) : method(method), param(param)
            {

            }

            MSGPACK_DEFINE_MAP(method, param);
        };

        struct makeParam
        {
            std::string envName;
            int64_t seed;
            MSGPACK_DEFINE_MAP(envName, seed);
        };

        struct infoParam
        {
            int x;
            MSGPACK_DEFINE_MAP(x);
        };

        struct resetParam
        {
            int x;
            MSGPACK_DEFINE_MAP(x);
        };

        struct stepParam
        {
            int64_t action;
            bool render;
            MSGPACK_DEFINE_MAP(action, render);
        };

        struct MakeResponse
        {
            std::string result;
            MSGPACK_DEFINE_MAP(result);
        };

        /**
         * @brief Action and observation spaces of the remote environment
         */
        struct InfoResponse
        {
            std::string actionSpaceType;                ///< Only "Discrete" is accepted
            std::vector<int64_t> actionSpaceShape;      ///< {number of actions}
            std::string observationSpaceType;
            std::vector<int64_t> observationSpaceShape;
            MSGPACK_DEFINE_MAP(actionSpaceType, actionSpaceShape, observationSpaceType, observationSpaceShape);
        };

        struct ResetResponse
        {
            std::vector<float> observation;
            MSGPACK_DEFINE_MAP(observation);
        };

        struct StepResponse
        {
            std::vector<float> observation;
            float reward;
            bool terminated;
            bool truncated;
            MSGPACK_DEFINE_MAP(observation, reward, terminated, truncated);
        };
    }
}

#endif //METASAC_REQUEST_HPP
