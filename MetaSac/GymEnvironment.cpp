//
// Created by moinshaikh on 2/14/26.
//

#include<stdexcept>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"GymEnvironment.hpp"

namespace MetaSac
{
    GymEnvironment::GymEnvironment(Gym::Communicator &communicator, const std::string &envName, int64_t seed) :
    communicator(communicator)
    {
        auto makeParams = std::make_shared<Gym::makeParam>();
        makeParams->envName = envName;
        makeParams->seed = seed;
        communicator.sendRequest(Gym::Request<Gym::makeParam>("make", makeParams));
        spdlog::info(communicator.getResponse<Gym::MakeResponse>()->result);

        communicator.sendRequest(Gym::Request<Gym::infoParam>("info", std::make_shared<Gym::infoParam>()));
        info = *communicator.getResponse<Gym::InfoResponse>();

        if (info.actionSpaceType != "Discrete" || info.actionSpaceShape.size() != 1)
        {
            throw std::runtime_error("Unsupported action space type " + info.actionSpaceType);
        }
        spdlog::info("Action space: {} - [{}]", info.actionSpaceType, info.actionSpaceShape[0]);
        spdlog::info("Observation space: {} - {} dims", info.observationSpaceType, info.observationSpaceShape.size());
    }

    torch::Tensor GymEnvironment::toTensor(std::vector<float> observation) const
    {
        if (static_cast<int64_t>(observation.size()) != observationSize())
        {
            throw std::runtime_error("Gym server sent an observation of the wrong size");
        }
        return torch::from_blob(observation.data(), {static_cast<int64_t>(observation.size())}).clone();
    }

    torch::Tensor GymEnvironment::reset()
    {
        communicator.sendRequest(Gym::Request<Gym::resetParam>("reset", std::make_shared<Gym::resetParam>()));
        return toTensor(communicator.getResponse<Gym::ResetResponse>()->observation);
    }

    StepResult GymEnvironment::step(int64_t action)
    {
        auto stepParams = std::make_shared<Gym::stepParam>();
        stepParams->action = action;
        stepParams->render = false;
        communicator.sendRequest(Gym::Request<Gym::stepParam>("step", stepParams));

        auto response = communicator.getResponse<Gym::StepResponse>();
        return {toTensor(response->observation), response->reward, response->terminated, response->truncated};
    }

    ActionSpace GymEnvironment::actionSpace() const
    {
        return {info.actionSpaceType, info.actionSpaceShape};
    }

    std::vector<int64_t> GymEnvironment::observationShape() const
    {
        return info.observationSpaceShape;
    }
}
