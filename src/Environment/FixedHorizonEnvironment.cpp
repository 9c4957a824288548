//
// Created by moinshaikh on 2/11/26.
//

#include<stdexcept>
#include<string>

#include<torch/torch.h>

#include"../../include/Environment/FixedHorizonEnvironment.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    FixedHorizonEnvironment::FixedHorizonEnvironment(int64_t numActions,
        int64_t horizon,
        int64_t rewardedAction,
        bool terminateAtHorizon) :
    actions(numActions),
    horizon(horizon),
    rewardedAction(rewardedAction),
    terminateAtHorizon(terminateAtHorizon),
    elapsed(0)
    {
        if (numActions < 1 || horizon < 1)
        {
            throw std::runtime_error("FixedHorizonEnvironment needs at least one action and one step");
        }
    }

    torch::Tensor FixedHorizonEnvironment::observe() const
    {
        return torch::tensor({static_cast<float>(elapsed) / horizon, 1.f});
    }

    torch::Tensor FixedHorizonEnvironment::reset()
    {
        elapsed = 0;
        return observe();
    }

    StepResult FixedHorizonEnvironment::step(int64_t action)
    {
        if (action < 0 || action >= actions)
        {
            throw std::runtime_error("Invalid action " + std::to_string(action));
        }
        ++elapsed;
        const bool atHorizon = elapsed >= horizon;
        return {observe(),
                action == rewardedAction ? 1. : 0.,
                atHorizon && terminateAtHorizon,
                atHorizon && !terminateAtHorizon};
    }

    ActionSpace FixedHorizonEnvironment::actionSpace() const
    {
        return ActionSpace{"Discrete", {actions}};
    }

    std::vector<int64_t> FixedHorizonEnvironment::observationShape() const
    {
        return {2};
    }

    TEST_CASE("FixedHorizonEnvironment")
    {
        FixedHorizonEnvironment environment(2, 3, 0);

        SUBCASE("Rewards only the chosen action")
        {
            environment.reset();
            CHECK(environment.step(0).reward == doctest::Approx(1));
            CHECK(environment.step(1).reward == doctest::Approx(0));
        }

        SUBCASE("Terminates exactly at the horizon")
        {
            environment.reset();
            CHECK(!environment.step(0).terminated);
            CHECK(!environment.step(0).terminated);
            auto last = environment.step(0);
            CHECK(last.terminated);
            CHECK(!last.truncated);
        }

        SUBCASE("Can truncate instead of terminating")
        {
            FixedHorizonEnvironment truncating(2, 1, 0, false);
            truncating.reset();
            auto last = truncating.step(1);
            CHECK(!last.terminated);
            CHECK(last.truncated);
        }

        SUBCASE("Observations have the declared shape")
        {
            CHECK(environment.reset().sizes().vec() == environment.observationShape());
            CHECK(environment.observationSize() == 2);
            CHECK(numActions(environment.actionSpace()) == 2);
        }

        SUBCASE("sampleAction() stays inside the action space")
        {
            for (int i = 0; i < 20; ++i)
            {
                auto action = environment.sampleAction();
                CHECK(action >= 0);
                CHECK(action < 2);
            }
        }

        SUBCASE("Invalid actions are rejected")
        {
            environment.reset();
            CHECK_THROWS_AS(environment.step(2), std::runtime_error);
        }
    }
}
