/**
 * @file ActorCritic.cpp
 * @brief Recurrent discrete soft actor-critic network
 * @author moinshaikh
 * @date 2/6/26
 *
 * Acting helpers (act / explore / advanceMemory) are single step and run without
 * gradient tracking; the training losses call the sub-modules directly on whole
 * episodes.
 */

#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Model/ActorCritic.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/Space.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    /**
     * @brief ActorCriticImpl constructor
     *
     * Builds the memory encoder over observation + one-hot action + reward, the categorical
     * head on top of it and the twin Q-networks on the observation, then registers them as
     * sub-modules so parameters(), save and load see all four.
     *
     * @throws std::runtime_error if unsupported action space type is provided
     */
    ActorCriticImpl::ActorCriticImpl(int64_t observationSize, ActionSpace actionSpace, int64_t hiddenSize) :
    actionSpace(actionSpace)
    {
        if (actionSpace.type != "Discrete" || numActions(actionSpace) < 1)
        {
            throw std::runtime_error("Unsupported action space type: " + actionSpace.type);
        }
        const auto actions = numActions(actionSpace);

        memory = register_module("memory", std::make_shared<MemoryEncoder>(observationSize, actions, hiddenSize));
        pi = register_module("pi", std::make_shared<PolicyHead>(hiddenSize, actions));
        q1 = register_module("q1", std::make_shared<QNetwork>(observationSize, actions, hiddenSize));
        q2 = register_module("q2", std::make_shared<QNetwork>(observationSize, actions, hiddenSize));
    }

    std::vector<torch::Tensor> ActorCriticImpl::encodeStep(torch::Tensor observation,
        int64_t prevAction,
        double prevReward,
        torch::Tensor hidden)
    {
        // Environments hand out CPU observations; the step runs where the weights live
        const auto device = memory->getDevice();
        auto input = observation.reshape({1, -1}).to(device, torch::kFloat);
        auto action = torch::full({1}, prevAction, torch::TensorOptions(torch::kLong).device(device));
        auto reward = torch::full({1}, prevReward, torch::TensorOptions(torch::kFloat).device(device));
        return memory->forward(input, action, reward, hidden.to(device));
    }

    std::vector<torch::Tensor> ActorCriticImpl::act(torch::Tensor observation,
        int64_t prevAction,
        double prevReward,
        torch::Tensor hidden)
    {
        torch::NoGradGuard noGrad;
        auto encoded = encodeStep(observation, prevAction, prevReward, hidden);
        auto action = pi->greedy(encoded[0]).squeeze(0);
        return {action, encoded[1]};
    }

    std::vector<torch::Tensor> ActorCriticImpl::explore(torch::Tensor observation,
        int64_t prevAction,
        double prevReward,
        torch::Tensor hidden)
    {
        torch::NoGradGuard noGrad;
        auto encoded = encodeStep(observation, prevAction, prevReward, hidden);
        auto action = pi->sample(encoded[0])[0].squeeze(0);
        return {action, encoded[1]};
    }

    torch::Tensor ActorCriticImpl::advanceMemory(torch::Tensor observation,
        int64_t prevAction,
        double prevReward,
        torch::Tensor hidden)
    {
        torch::NoGradGuard noGrad;
        return encodeStep(observation, prevAction, prevReward, hidden)[1];
    }

    std::vector<torch::Tensor> ActorCriticImpl::criticParameters() const
    {
        auto parameters = q1->parameters();
        auto second = q2->parameters();
        parameters.insert(parameters.end(), second.begin(), second.end());
        return parameters;
    }

    std::vector<torch::Tensor> ActorCriticImpl::policyParameters() const
    {
        auto parameters = pi->parameters();
        auto encoder = memory->parameters();
        parameters.insert(parameters.end(), encoder.begin(), encoder.end());
        return parameters;
    }

    std::vector<std::pair<std::string, int64_t>> ActorCriticImpl::parameterCounts() const
    {
        return {{"pi", countParameters(pi->parameters())},
                {"q1", countParameters(q1->parameters())},
                {"q2", countParameters(q2->parameters())},
                {"memory", countParameters(memory->parameters())}};
    }

    torch::Tensor ActorCriticImpl::initialHidden() const
    {
        return memory->initialHidden();
    }

    TEST_CASE("ActorCritic")
    {
        ActionSpace space{"Discrete", {3}};
        auto actorCritic = ActorCritic(4, space, 8);

        SUBCASE("Non-discrete action spaces are rejected")
        {
            CHECK_THROWS_AS(ActorCritic(4, ActionSpace{"Box", {3}}, 8), std::runtime_error);
        }

        SUBCASE("act() returns a valid greedy action and the next recurrent state")
        {
            auto outputs = actorCritic->act(torch::rand({4}), 0, 0., actorCritic->initialHidden());

            REQUIRE(outputs.size() == 2);
            CHECK(outputs[0].dim() == 0);
            CHECK(outputs[0].item().toLong() >= 0);
            CHECK(outputs[0].item().toLong() < 3);
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{1, 1, 8});
            CHECK(!outputs[1].requires_grad());
        }

        SUBCASE("explore() samples valid actions")
        {
            auto hidden = actorCritic->initialHidden();
            for (int i = 0; i < 20; ++i)
            {
                auto outputs = actorCritic->explore(torch::rand({4}), i % 3, 1., hidden);
                CHECK(outputs[0].item().toLong() >= 0);
                CHECK(outputs[0].item().toLong() < 3);
                hidden = outputs[1];
            }
        }

        SUBCASE("act() and advanceMemory() produce the same recurrent state")
        {
            auto observation = torch::rand({4});
            auto hidden = torch::rand({1, 1, 8});
            auto acted = actorCritic->act(observation, 2, 0.5, hidden);
            auto advanced = actorCritic->advanceMemory(observation, 2, 0.5, hidden);

            CHECK(torch::allclose(acted[1], advanced));
        }

        SUBCASE("Steps run on the device of the network")
        {
            CHECK(actorCritic->initialHidden().device() == actorCritic->getDevice());

            if (torch::cuda::is_available())
            {
                actorCritic->to(torch::kCUDA);
                auto hidden = actorCritic->initialHidden();
                CHECK(hidden.is_cuda());

                auto acted = actorCritic->act(torch::rand({4}), 1, 0.5, hidden);
                auto explored = actorCritic->explore(torch::rand({4}), 1, 0.5, acted[1]);
                auto advanced = actorCritic->advanceMemory(torch::rand({4}), 1, 0.5, torch::zeros({1, 1, 8}));

                CHECK(acted[1].is_cuda());
                CHECK(explored[1].is_cuda());
                CHECK(advanced.is_cuda());
            }
        }

        SUBCASE("Parameter groups partition the parameters")
        {
            auto critic = actorCritic->criticParameters();
            auto policy = actorCritic->policyParameters();

            CHECK(critic.size() + policy.size() == actorCritic->parameters().size());
            CHECK(countParameters(critic) + countParameters(policy) ==
                  countParameters(actorCritic->parameters()));
        }

        SUBCASE("parameterCounts() lists every sub-module")
        {
            auto counts = actorCritic->parameterCounts();

            REQUIRE(counts.size() == 4);
            CHECK(counts[0].first == "pi");
            CHECK(counts[0].second == 8 * 3 + 3);
            CHECK(counts[1].second == counts[2].second);
        }
    }
}
