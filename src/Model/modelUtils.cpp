//
// Created by moinshaikh on 2/4/26.
//

#include<stdexcept>

#include<torch/torch.h>


#include"../../include/Model/modelUtils.hpp"
#include<doctest/doctest.h>


namespace MetaSac
{
    namespace
    {
        void checkAligned(const std::vector<torch::Tensor> &online, const std::vector<torch::Tensor> &target)
        {
            if (online.size() != target.size())
            {
                throw std::runtime_error("Online and target parameter lists differ in length: " +
                                         std::to_string(online.size()) + " vs " + std::to_string(target.size()));
            }
            for (size_t i = 0; i < online.size(); ++i)
            {
                if (online[i].sizes() != target[i].sizes())
                {
                    throw std::runtime_error("Online and target parameter " + std::to_string(i) +
                                             " have different shapes");
                }
            }
        }
    }

    /**
     * @brief Fills the input `tensor` with a (semi) orthogonal matrix using QR decomposition
     *
     * Implements orthogonal weight initialization as described in "Exact solutions to the
     * nonlinear dynamics of learning in deep linear neural networks". This technique maintains
     * well-conditioned weight matrices and improves gradient flow during backpropagation,
     * which matters for the GRU weights of the memory encoder.
     *
     * **Algorithm Overview:**
     * - Step 1: Generate random matrix from standard normal distribution
     * - Step 2: Compute QR decomposition to extract orthogonal component
     * - Step 3: Apply phase correction based on diagonal signs
     * - Step 4: Scale result by gain parameter
     *
     * @param tensor an n-dimensional tensor, where n >= 2
     * @param gains the multiplier scalar for the weights (typically 1.0 or √2 ≈ 1.414)
     * @return torch::Tensor the orthogonally initialized tensor with shape preserved
     *
     * @warning Computation is done without gradient tracking (torch::NoGradGuard enabled)
     */
    torch::Tensor orthogonal_(torch::Tensor tensor,double gains)
    {
        torch::NoGradGuard gaurd;
        if (tensor.dim() < 2)
        {
            return tensor;
        }

        const auto rows = tensor.size(0);
        const auto columns = tensor.numel() / rows;
        auto flattened = torch::randn({rows,columns});
        if (rows<columns)
        {
            flattened.t_();
        }
        torch::Tensor q,r;
        std::tie(q,r )= torch::linalg_qr(flattened);
        auto d = torch::diag(r, 0);
        auto ph = d.sign();
        q *= ph;

        if (rows < columns)
        {
            q.t_();
        }

        tensor.view_as(q).copy_(q);
        tensor.mul_(gains);

        return tensor;
    }

    /**
     * @brief Initializes every weight orthogonally and every bias to a constant.
     */
    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters,
                  double weight_gain,
                  double bias_gain)
    {
        for (const auto &parameter : parameters)
        {
            if (parameter.value().size(0) != 0)
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    torch::nn::init::constant_(parameter.value(), bias_gain);
                }
                else if (parameter.key().find("weight") != std::string::npos)
                {
                    orthogonal_(parameter.value(), weight_gain);
                }
            }
        }
    }

    void hardUpdate(const std::vector<torch::Tensor> &online, const std::vector<torch::Tensor> &target)
    {
        checkAligned(online, target);
        torch::NoGradGuard noGrad;
        for (size_t i = 0; i < online.size(); ++i)
        {
            target[i].copy_(online[i]);
        }
    }

    /**
     * @brief In-place polyak averaging of an aligned parameter list.
     *
     * Uses mul_/add_ on the target tensors themselves so that modules holding the
     * target parameters observe the new values without re-registration.
     */
    void polyakUpdate(const std::vector<torch::Tensor> &online, const std::vector<torch::Tensor> &target, double polyak)
    {
        checkAligned(online, target);
        torch::NoGradGuard noGrad;
        for (size_t i = 0; i < online.size(); ++i)
        {
            target[i].mul_(polyak);
            target[i].add_(online[i], 1.0 - polyak);
        }
    }

    int64_t countParameters(const std::vector<torch::Tensor> &parameters)
    {
        int64_t count = 0;
        for (const auto &parameter : parameters)
        {
            count += parameter.numel();
        }
        return count;
    }

    TEST_CASE("init_weights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Linear(5, 10),
            torch::nn::Functional(torch::relu),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0);

        SUBCASE("Bias weights are initialized to 0")
        {
            for (const auto &parameter : module->named_parameters())
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    CHECK(parameter.value()[0].item().toDouble() == doctest::Approx(0));
                }
            }
        }

        SUBCASE("Weights are orthogonal")
        {
            auto weight = module->named_parameters()["0.weight"];
            auto gram = torch::matmul(weight.t(), weight);
            CHECK(torch::allclose(gram, torch::eye(5), 1e-4, 1e-4));
        }
    }

    TEST_CASE("hardUpdate()")
    {
        auto online = torch::nn::Linear(4, 3);
        auto target = torch::nn::Linear(4, 3);

        hardUpdate(online->parameters(), target->parameters());

        SUBCASE("Target is an element-wise copy of the online parameters")
        {
            for (size_t i = 0; i < online->parameters().size(); ++i)
            {
                CHECK(torch::equal(online->parameters()[i], target->parameters()[i]));
            }
        }

        SUBCASE("Target does not alias the online parameters")
        {
            {
                torch::NoGradGuard noGrad;
                online->weight.add_(1.0);
            }
            CHECK(!torch::equal(online->weight, target->weight));
            CHECK(online->weight.data_ptr() != target->weight.data_ptr());
        }

        SUBCASE("Mismatched parameter lists are rejected")
        {
            auto other = torch::nn::Linear(5, 3);
            CHECK_THROWS_AS(hardUpdate(online->parameters(), other->parameters()), std::runtime_error);
            CHECK_THROWS_AS(hardUpdate(online->parameters(), {other->weight}), std::runtime_error);
        }
    }

    TEST_CASE("polyakUpdate()")
    {
        auto online = torch::nn::Linear(6, 2);
        auto target = torch::nn::Linear(6, 2);
        for (auto &parameter : target->parameters())
        {
            parameter.set_requires_grad(false);
        }

        std::vector<torch::Tensor> old_target;
        for (const auto &parameter : target->parameters())
        {
            old_target.push_back(parameter.clone());
        }

        const double polyak = 0.9;
        polyakUpdate(online->parameters(), target->parameters(), polyak);

        SUBCASE("Every pair follows the smoothing formula")
        {
            for (size_t i = 0; i < old_target.size(); ++i)
            {
                auto expected = polyak * old_target[i] + (1 - polyak) * online->parameters()[i].detach();
                CHECK(torch::allclose(target->parameters()[i], expected, 1e-6, 1e-6));
            }
        }

        SUBCASE("No gradient is recorded for the update")
        {
            for (const auto &parameter : target->parameters())
            {
                CHECK(!parameter.requires_grad());
                CHECK(!parameter.grad_fn());
                CHECK(!parameter.grad().defined());
            }
        }

        SUBCASE("A coefficient of one leaves the target unchanged")
        {
            auto before = target->weight.clone();
            polyakUpdate(online->parameters(), target->parameters(), 1.0);
            CHECK(torch::equal(before, target->weight));
        }
    }

    TEST_CASE("countParameters()")
    {
        auto module = torch::nn::Linear(5, 10);
        CHECK(countParameters(module->parameters()) == 5 * 10 + 10);
    }
}
