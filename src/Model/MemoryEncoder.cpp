//
// Created by moinshaikh on 2/5/26.
//
#include<stdexcept>

#include<torch/torch.h>
#include<torch/nn.h>

#include"../../include/Model/MemoryEncoder.hpp"
#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    /**
     * @brief Constructs the MemoryEncoder object.
     *
     * - Builds a one layer GRU taking observation, one-hot action and reward.
     * - Registers the GRU module.
     * - Initializes GRU weights orthogonally with zero biases.
     */
    MemoryEncoder::MemoryEncoder(int64_t observationSize, int64_t numActions, int64_t hiddenSize) :
    gatedRecurrentUnit(nullptr),
    observationSize(observationSize),
    numActions(numActions),
    hiddenSize(hiddenSize)
    {
        gatedRecurrentUnit = torch::nn::GRU(torch::nn::GRUOptions(getInputSize(), hiddenSize));
        register_module("gatedRecurrentUnit", gatedRecurrentUnit);
        initWeights(gatedRecurrentUnit->named_parameters(), 1, 0);
    }

    /**
     * @brief Forwards a sequence through the GRU.
     *
     * Detailed steps:
     * - Reshapes the rewards to a column and one-hot encodes the previous actions.
     * - Concatenates them with the observations into [T, inputSize].
     * - Treats the T rows as one sequence of batch size 1 starting from `hidden`.
     */
    std::vector<torch::Tensor> MemoryEncoder::forward(torch::Tensor observations,
        torch::Tensor prevActions,
        torch::Tensor prevRewards,
        torch::Tensor hidden)
    {
        if (observations.dim() != 2 || observations.size(1) != observationSize)
        {
            throw std::runtime_error("MemoryEncoder expects observations of shape [T, " +
                                     std::to_string(observationSize) + "]");
        }
        const auto steps = observations.size(0);
        auto actions = torch::one_hot(prevActions.reshape({steps}).to(torch::kLong), numActions)
                           .to(observations.dtype());
        auto rewards = prevRewards.reshape({steps, 1}).to(observations.dtype());
        auto x = torch::cat({observations, actions, rewards}, -1);

        auto [output, state] = gatedRecurrentUnit->forward(x.unsqueeze(1),
                                                          hidden.reshape({1, 1, hiddenSize}));
        return {output.squeeze(1), state};
    }

    torch::Tensor MemoryEncoder::initialHidden() const
    {
        return torch::zeros({1, 1, hiddenSize}, torch::TensorOptions(getDevice()));
    }

    torch::Device MemoryEncoder::getDevice() const
    {
        return gatedRecurrentUnit->parameters()[0].device();
    }

    TEST_CASE("MemoryEncoder")
    {
        auto encoder = std::make_shared<MemoryEncoder>(5, 3, 10);

        SUBCASE("forward() outputs correct shapes for a single step")
        {
            auto outputs = encoder->forward(torch::rand({1, 5}),
                                            torch::zeros({1}, torch::kLong),
                                            torch::zeros({1}),
                                            encoder->initialHidden());

            REQUIRE(outputs.size() == 2);
            CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{1, 10});
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{1, 1, 10});
        }

        SUBCASE("forward() outputs one embedding per step of a sequence")
        {
            auto outputs = encoder->forward(torch::rand({7, 5}),
                                            torch::randint(0, 3, {7}, torch::kLong),
                                            torch::rand({7, 1}),
                                            torch::rand({1, 1, 10}));

            CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{7, 10});
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{1, 1, 10});
        }

        SUBCASE("Last embedding equals the final hidden state")
        {
            auto outputs = encoder->forward(torch::rand({4, 5}),
                                            torch::randint(0, 3, {4}, torch::kLong),
                                            torch::rand({4}),
                                            encoder->initialHidden());

            CHECK(torch::allclose(outputs[0][3], outputs[1].view({10})));
        }

        SUBCASE("Stepping one at a time matches encoding the whole sequence")
        {
            auto observations = torch::rand({3, 5});
            auto actions = torch::randint(0, 3, {3}, torch::kLong);
            auto rewards = torch::rand({3});

            auto whole = encoder->forward(observations, actions, rewards, encoder->initialHidden());

            auto hidden = encoder->initialHidden();
            for (int64_t step = 0; step < 3; ++step)
            {
                auto outputs = encoder->forward(observations[step].unsqueeze(0),
                                                actions[step].unsqueeze(0),
                                                rewards[step].unsqueeze(0),
                                                hidden);
                hidden = outputs[1];
            }
            CHECK(torch::allclose(whole[1], hidden, 1e-5, 1e-6));
        }

        SUBCASE("The initial hidden state lives with the weights")
        {
            CHECK(encoder->initialHidden().device() == encoder->getDevice());

            if (torch::cuda::is_available())
            {
                encoder->to(torch::kCUDA);
                CHECK(encoder->initialHidden().device().is_cuda());
            }
        }

        SUBCASE("Observations of the wrong width are rejected")
        {
            CHECK_THROWS_AS(encoder->forward(torch::rand({2, 4}),
                                             torch::zeros({2}, torch::kLong),
                                             torch::zeros({2}),
                                             encoder->initialHidden()),
                            std::runtime_error);
        }
    }
}
