//
// Created by moinshaikh on 2/4/26.
//

#include<cmath>

#include<torch/torch.h>

#include"../../include/Model/QNetwork.hpp"
#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    /**
     * @brief Constructs the soft Q-network
     *
     * **Architecture:**
     * ```
     * q(x) = W_q·tanh(W₂·tanh(W₁·x + b₁) + b₂) + b_q
     *        where W₁ ∈ ℝ^(hidden_size × num_inputs)
     *              W₂ ∈ ℝ^(hidden_size × hidden_size)
     *              W_q ∈ ℝ^(num_actions × hidden_size)
     * ```
     *
     * **Weight Initialization:**
     * - Hidden layers: orthogonal, gain √2 to compensate for the tanh squashing
     * - Output layer: orthogonal, gain 1
     * - All biases: 0
     */
    QNetwork::QNetwork(int64_t numInputs, int64_t numActions, int64_t hiddenSize) :
    trunk(torch::nn::Linear(numInputs, hiddenSize),
          torch::nn::Functional(torch::tanh),
          torch::nn::Linear(hiddenSize, hiddenSize),
          torch::nn::Functional(torch::tanh)),
    qLinear(hiddenSize, numActions),
    numInputs(numInputs)
    {
        register_module("trunk", trunk);
        register_module("qLinear", qLinear);

        initWeights(trunk->named_parameters(), std::sqrt(2.), 0);
        initWeights(qLinear->named_parameters(), 1, 0);
    }

    torch::Tensor QNetwork::forward(torch::Tensor inputs)
    {
        return qLinear->forward(trunk->forward(inputs));
    }

    TEST_CASE("QNetwork")
    {
        auto network = QNetwork(5, 3, 10);

        SUBCASE("Outputs one value per action")
        {
            auto q = network.forward(torch::rand({4, 5}));

            CHECK(q.sizes().vec() == std::vector<int64_t>{4, 3});
        }

        SUBCASE("Has the expected number of parameters")
        {
            CHECK(countParameters(network.parameters()) == (5 * 10 + 10) + (10 * 10 + 10) + (10 * 3 + 3));
        }

        SUBCASE("Gradients flow to every parameter")
        {
            auto loss = network.forward(torch::rand({2, 5})).pow(2).mean();
            loss.backward();

            for (const auto &parameter : network.parameters())
            {
                CHECK(parameter.grad().defined());
            }
        }
    }
}
