//
// Created by moinshaikh on 2/6/26.
//

#include<memory>

#include<torch/torch.h>

#include"../../include/Model/PolicyHead.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/Distribution/Categorical.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    PolicyHead::PolicyHead(int64_t numInputs, int64_t numOutputs) :
    linear(numInputs,numOutputs)
    {
        register_module("linear",linear);
        initWeights(linear->named_parameters(),0.01,0);
    }

    std::unique_ptr<Categorical> PolicyHead::forward(torch::Tensor x)
    {
        return std::make_unique<Categorical>(linear(x));
    }

    std::vector<torch::Tensor> PolicyHead::sample(torch::Tensor embedding)
    {
        auto dist = forward(embedding);
        auto action = dist->sample();
        return {action, dist->getProbabilities(), dist->getLogProbabilities(), dist->entropy()};
    }

    torch::Tensor PolicyHead::greedy(torch::Tensor embedding)
    {
        return forward(embedding)->mode();
    }

    TEST_CASE("PolicyHead")
    {
        auto head = PolicyHead(3, 5);
        float input_array[2][3] = {{0, 1, 2}, {3, 4, 5}};
        auto input_tensor = torch::from_blob(input_array,
                                             {2, 3},
                                             torch::TensorOptions(torch::kFloat));

        SUBCASE("Output distribution has correct output shape")
        {
            auto dist = head.forward(input_tensor);

            auto output = dist->sample();

            CHECK(output.sizes().vec() == std::vector<int64_t>{2});
        }

        SUBCASE("sample() returns action, probabilities, log-probabilities and entropy")
        {
            auto outputs = head.sample(input_tensor);

            REQUIRE(outputs.size() == 4);
            CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{2});
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{2, 5});
            CHECK(outputs[2].sizes().vec() == std::vector<int64_t>{2, 5});
            CHECK(torch::allclose(outputs[1].sum(-1), torch::ones({2})));
            CHECK(torch::allclose(outputs[2].exp(), outputs[1]));
            CHECK(outputs[3].sizes().vec() == std::vector<int64_t>{2, 1});
            CHECK(torch::allclose(outputs[3], -(outputs[1] * outputs[2]).sum(-1, true)));
        }

        SUBCASE("Probabilities are differentiable with respect to the head")
        {
            auto outputs = head.sample(input_tensor);
            CHECK(outputs[1].requires_grad());
            CHECK(outputs[3].requires_grad());
            CHECK(!outputs[0].requires_grad());
        }

        SUBCASE("greedy() picks the arg-max of the probabilities")
        {
            auto probabilities = head.sample(input_tensor)[1];
            auto greedy = head.greedy(input_tensor);

            CHECK(torch::equal(greedy, probabilities.argmax(-1)));
        }
    }
}
