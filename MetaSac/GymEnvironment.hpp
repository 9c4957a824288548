#pragma once
//
// Created by moinshaikh on 2/14/26.
//

#ifndef METASAC_GYMENVIRONMENT_HPP
#define METASAC_GYMENVIRONMENT_HPP

#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../include/Environment/Environment.hpp"
#include"Communication.hpp"

namespace MetaSac
{
    /**
     * @class GymEnvironment
     * @brief Environment living in a remote gym server
     *
     * The constructor creates the environment on the server and queries its spaces.
     * Non-discrete action spaces are rejected.
     */
    class GymEnvironment : public Environment
    {
    private:
        Gym::Communicator &communicator;
        Gym::InfoResponse info;

        torch::Tensor toTensor(std::vector<float> observation) const;
    public:
        /**
         * @throws std::runtime_error when the server fails to answer or the action space
         *         is not "Discrete".
         */
        GymEnvironment(Gym::Communicator &communicator, const std::string &envName, int64_t seed);

        torch::Tensor reset() override;

        StepResult step(int64_t action) override;

        ActionSpace actionSpace() const override;

        std::vector<int64_t> observationShape() const override;
    };
}

#endif //METASAC_GYMENVIRONMENT_HPP
