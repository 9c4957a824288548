//
// Created by moinshaikh on 1/30/26.
//

#include<cmath>
#include<stdexcept>
#include<vector>

#include<torch/torch.h>

#include"../../include/Distribution/Categorical.hpp"
#include<doctest/doctest.h>


namespace MetaSac
{
    /**
     * @brief Normalises the logits of every row.
     *
     * Log-probabilities are the logits minus their log-sum-exp, which keeps them finite for
     * large scores; the probabilities are their softmax.
     */
    Categorical::Categorical(torch::Tensor logits)
    {
        if (logits.dim() < 1)
        {
            throw std::runtime_error("Categorical needs logits with at least one dimension");
        }
        logProbabilities = logits - logits.logsumexp(-1, true);
        probabilities = torch::softmax(logits, -1);
        numActions = logits.size(-1);
    }

    torch::Tensor Categorical::entropy()
    {
        return -(probabilities * logProbabilities).sum(-1, true);
    }

    torch::Tensor Categorical::sample()
    {
        auto batchShape = probabilities.sizes().vec();
        batchShape.pop_back();

        auto rows = probabilities.detach().reshape({-1, numActions});
        return torch::multinomial(rows, 1, true).view(batchShape);
    }

    torch::Tensor Categorical::mode()
    {
        return probabilities.argmax(-1);
    }

    TEST_CASE("Categorical")
    {
        SUBCASE("Logits without a dimension are rejected")
        {
            CHECK_THROWS_AS(Categorical(torch::scalar_tensor(1.)), std::runtime_error);
        }

        SUBCASE("Rows are normalised")
        {
            auto dist = Categorical(torch::tensor({{1.0f, 2.0f, 3.0f}, {-50.f, 0.f, 50.f}}));

            CHECK(torch::allclose(dist.getProbabilities().sum(-1), torch::ones({2})));
            CHECK(torch::allclose(dist.getLogProbabilities().exp(), dist.getProbabilities(), 1e-5, 1e-6));
            CHECK(torch::isfinite(dist.getLogProbabilities()).all().item<bool>());
            CHECK(dist.getNumActions() == 3);
        }

        SUBCASE("sample() draws one valid action per row")
        {
            auto dist = Categorical(torch::zeros({7, 5}));

            auto actions = dist.sample();

            CHECK(actions.sizes().vec() == std::vector<int64_t>{7});
            CHECK(actions.scalar_type() == torch::kLong);
            CHECK((actions >= 0).all().item<bool>());
            CHECK((actions < 5).all().item<bool>());
        }

        SUBCASE("sample() keeps leading batch dimensions")
        {
            auto dist = Categorical(torch::zeros({2, 3, 4}));

            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2, 3});
        }

        SUBCASE("sample() follows a near-deterministic distribution")
        {
            auto dist = Categorical(torch::tensor({{-100.f, 100.f, -100.f}, {-100.f, -100.f, 100.f}}));

            auto actions = dist.sample();

            CHECK(actions[0].item<int64_t>() == 1);
            CHECK(actions[1].item<int64_t>() == 2);
        }

        SUBCASE("entropy() is log(n) for a uniform row and 0 for a certain one")
        {
            auto dist = Categorical(torch::tensor({{0.f, 0.f, 0.f, 0.f}, {-100.f, 100.f, -100.f, -100.f}}));

            auto entropies = dist.entropy();

            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2, 1});
            CHECK(entropies[0][0].item<double>() == doctest::Approx(std::log(4.)).epsilon(1e-5));
            CHECK(entropies[1][0].item<double>() == doctest::Approx(0.).epsilon(1e-5));
        }

        SUBCASE("mode() picks the most probable action")
        {
            auto dist = Categorical(torch::tensor({{0.1f, 0.7f, 0.2f}, {0.6f, 0.3f, 0.1f}}).log());

            auto modes = dist.mode();

            CHECK(modes.sizes().vec() == std::vector<int64_t>{2});
            CHECK(modes[0].item<int64_t>() == 1);
            CHECK(modes[1].item<int64_t>() == 0);
        }
    }
}
