//
// Created by moinshaikh on 2/9/26.
//

#include<cmath>
#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Algorithms/EntropyTemperature.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    EntropyTemperature::EntropyTemperature(bool learned,
        double fixedAlpha,
        int64_t numActions,
        double entropyTargetMult,
        double learningRate,
        torch::Device device) :
    learned(learned),
    fixedAlpha(fixedAlpha),
    targetEntropy(entropyTargetMult * std::log(static_cast<double>(numActions)))
    {
        if (fixedAlpha < 0)
        {
            throw std::runtime_error("Entropy temperature must be non-negative");
        }
        if (learned)
        {
            logAlpha = torch::zeros({1}, torch::TensorOptions(device).requires_grad(true));
            optimizer = std::make_unique<torch::optim::Adam>(std::vector<torch::Tensor>{logAlpha},
                                                             torch::optim::AdamOptions(learningRate));
        }
    }

    double EntropyTemperature::alpha() const
    {
        if (!learned)
        {
            return fixedAlpha;
        }
        return logAlpha.detach().exp().item<double>();
    }

    torch::Tensor EntropyTemperature::update(torch::Tensor logProbabilities)
    {
        if (!learned)
        {
            return torch::scalar_tensor(0.);
        }
        auto alphaLoss = -(logAlpha * (logProbabilities.detach() + targetEntropy)).mean();

        optimizer->zero_grad();
        alphaLoss.backward();
        optimizer->step();

        return alphaLoss.detach();
    }

    void EntropyTemperature::setLogAlpha(torch::Tensor value)
    {
        if (!learned)
        {
            throw std::runtime_error("Cannot set log_alpha on a fixed entropy temperature");
        }
        if (value.numel() != 1)
        {
            throw std::runtime_error("log_alpha must hold a single value");
        }
        torch::NoGradGuard noGrad;
        logAlpha.copy_(value.reshape({1}));
    }

    TEST_CASE("EntropyTemperature")
    {
        SUBCASE("Fixed alpha never changes and reports a zero loss")
        {
            EntropyTemperature temperature(false, 0.2, 4, 0.98, 1e-2);

            auto loss = temperature.update(torch::full({5, 4}, -0.1));

            CHECK(temperature.alpha() == doctest::Approx(0.2));
            CHECK(loss.item().toDouble() == doctest::Approx(0));
            CHECK(!temperature.getLogAlpha().defined());
        }

        SUBCASE("Target entropy is a fraction of log(|A|)")
        {
            EntropyTemperature temperature(true, 0.2, 4, 0.98, 1e-2);

            CHECK(temperature.getTargetEntropy() == doctest::Approx(0.98 * std::log(4.)));
            CHECK(temperature.alpha() == doctest::Approx(1));
        }

        SUBCASE("Alpha grows while log-probabilities are above the negative target")
        {
            EntropyTemperature temperature(true, 0.2, 4, 0.98, 1e-2);

            for (int i = 0; i < 5; ++i)
            {
                temperature.update(torch::zeros({5, 4}));
            }

            CHECK(temperature.getLogAlpha().item().toDouble() > 0);
            CHECK(temperature.alpha() > 1);
        }

        SUBCASE("Alpha shrinks but stays positive while the policy is too random")
        {
            EntropyTemperature temperature(true, 0.2, 4, 0.98, 1e-1);

            for (int i = 0; i < 50; ++i)
            {
                temperature.update(torch::full({5, 4}, -std::log(4.) - 1));
            }

            CHECK(temperature.getLogAlpha().item().toDouble() < 0);
            CHECK(temperature.alpha() > 0);
            CHECK(temperature.alpha() < 1);
        }

        SUBCASE("setLogAlpha() restores a saved temperature")
        {
            EntropyTemperature temperature(true, 0.2, 4, 0.98, 1e-2);
            auto tracked = temperature.getLogAlpha();

            temperature.setLogAlpha(torch::full({1}, -1.5));

            CHECK(temperature.alpha() == doctest::Approx(std::exp(-1.5)));
            CHECK(temperature.getLogAlpha().data_ptr() == tracked.data_ptr());
            CHECK(temperature.getLogAlpha().requires_grad());

            temperature.update(torch::zeros({2, 4}));
            CHECK(temperature.getLogAlpha().item().toDouble() > -1.5);
        }

        SUBCASE("setLogAlpha() is refused on a fixed temperature or a wrong size")
        {
            EntropyTemperature fixed(false, 0.2, 4, 0.98, 1e-2);
            EntropyTemperature learned(true, 0.2, 4, 0.98, 1e-2);

            CHECK_THROWS_AS(fixed.setLogAlpha(torch::zeros({1})), std::runtime_error);
            CHECK_THROWS_AS(learned.setLogAlpha(torch::zeros({2})), std::runtime_error);
        }

        SUBCASE("Negative fixed alpha is rejected")
        {
            CHECK_THROWS_AS(EntropyTemperature(false, -0.1, 4, 0.98, 1e-2), std::runtime_error);
        }
    }
}
