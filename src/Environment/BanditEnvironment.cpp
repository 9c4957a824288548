//
// Created by moinshaikh on 2/11/26.
//

#include<cmath>
#include<stdexcept>
#include<string>

#include<torch/torch.h>

#include"../../include/Environment/BanditEnvironment.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    BanditEnvironment::BanditEnvironment(int64_t numArms, int64_t pullsPerTrial, int64_t trialsPerTask) :
    arms(numArms),
    pullsPerTrial(pullsPerTrial),
    trialsPerTask(trialsPerTask),
    pulls(0),
    resets(0)
    {
        if (numArms < 2 || pullsPerTrial < 1 || trialsPerTask < 1)
        {
            throw std::runtime_error("BanditEnvironment needs at least two arms, one pull and one trial per task");
        }
        resampleTask();
    }

    void BanditEnvironment::resampleTask()
    {
        armProbabilities = torch::rand({arms});
    }

    torch::Tensor BanditEnvironment::reset()
    {
        if (resets > 0 && resets % trialsPerTask == 0)
        {
            resampleTask();
        }
        ++resets;
        pulls = 0;
        return torch::ones({1});
    }

    StepResult BanditEnvironment::step(int64_t action)
    {
        if (action < 0 || action >= arms)
        {
            throw std::runtime_error("Invalid arm " + std::to_string(action));
        }
        ++pulls;
        const auto payout = torch::rand({1}).item<double>() < armProbabilities[action].item<double>();
        return {torch::ones({1}), payout ? 1. : 0., false, pulls >= pullsPerTrial};
    }

    ActionSpace BanditEnvironment::actionSpace() const
    {
        return ActionSpace{"Discrete", {arms}};
    }

    std::vector<int64_t> BanditEnvironment::observationShape() const
    {
        return {1};
    }

    TEST_CASE("BanditEnvironment")
    {
        torch::manual_seed(0);
        BanditEnvironment environment(3, 4, 2);

        SUBCASE("Trials are truncated after the configured number of pulls")
        {
            environment.reset();
            for (int pull = 0; pull < 3; ++pull)
            {
                auto result = environment.step(0);
                CHECK(!result.truncated);
                CHECK(!result.terminated);
            }
            CHECK(environment.step(0).truncated);
        }

        SUBCASE("Arm probabilities change only between tasks")
        {
            environment.reset();
            auto first = environment.getArmProbabilities().clone();
            environment.reset();
            CHECK(torch::equal(first, environment.getArmProbabilities()));
            environment.reset();
            CHECK(!torch::equal(first, environment.getArmProbabilities()));
        }

        SUBCASE("Rewards are Bernoulli draws with the arm probability")
        {
            environment.reset();
            const auto probability = environment.getArmProbabilities()[1].item<double>();
            double total = 0;
            const int pulls = 4000;
            for (int pull = 0; pull < pulls; ++pull)
            {
                auto reward = environment.step(1).reward;
                CHECK((reward == 0. || reward == 1.));
                total += reward;
            }
            CHECK(std::abs(total / pulls - probability) < 0.05);
        }

        SUBCASE("Invalid arms are rejected")
        {
            environment.reset();
            CHECK_THROWS_AS(environment.step(3), std::runtime_error);
        }
    }
}
