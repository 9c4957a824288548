#pragma once
//
// Created by moinshaikh on 2/11/26.
//

#ifndef METASAC_ENVIRONMENT_HPP
#define METASAC_ENVIRONMENT_HPP

#include<cstdint>
#include<vector>

#include<torch/torch.h>

#include"../Space.hpp"

namespace MetaSac
{
    /**
     * @brief Outcome of one environment step
     */
    struct StepResult
    {
        torch::Tensor observation;  ///< Observation after the step, shape observationShape()
        double reward;
        bool terminated;            ///< The task itself ended the episode
        bool truncated;             ///< The environment cut the episode short (time limit)
    };

    /**
     * @class Environment
     * @brief Gym-like interface the training and evaluation loops interact with.
     *
     * Only discrete action spaces are supported.
     */
    class Environment
    {
    public:
        virtual ~Environment() = 0;

        /** @brief Starts a new episode and returns its first observation */
        virtual torch::Tensor reset() = 0;

        /** @brief Applies `action` and returns the transition */
        virtual StepResult step(int64_t action) = 0;

        virtual ActionSpace actionSpace() const = 0;

        virtual std::vector<int64_t> observationShape() const = 0;

        /** @brief Uniformly random action, drawn from torch's global generator */
        virtual int64_t sampleAction()
        {
            return torch::randint(numActions(actionSpace()), {1}, torch::TensorOptions(torch::kLong)).item<int64_t>();
        }

        /** @return Number of elements of one flattened observation */
        inline int64_t observationSize() const
        {
            int64_t size = 1;
            for (auto dimension : observationShape())
            {
                size *= dimension;
            }
            return size;
        }
    };

    inline Environment::~Environment() {}
}

#endif //METASAC_ENVIRONMENT_HPP
