//
// Created by moinshaikh on 2/10/26.
//

#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Algorithms/ParameterPhase.hpp"
#include"../../include/Model/ActorCritic.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    ParameterPhaseScope::ParameterPhaseScope(ComputationPhase phase, ActorCriticImpl &actorCritic) :
    phase(phase)
    {
        switch (phase)
        {
            case ComputationPhase::Critic:
                excluded = actorCritic.policyParameters();
                break;
            case ComputationPhase::Policy:
                excluded = actorCritic.criticParameters();
                break;
            case ComputationPhase::Temperature:
                excluded = actorCritic.parameters();
                break;
        }

        previousFlags.reserve(excluded.size());
        for (auto &parameter : excluded)
        {
            previousFlags.push_back(parameter.requires_grad());
            parameter.requires_grad_(false);
        }
    }

    ParameterPhaseScope::~ParameterPhaseScope()
    {
        for (size_t i = 0; i < excluded.size(); ++i)
        {
            excluded[i].requires_grad_(previousFlags[i]);
        }
    }

    TEST_CASE("ParameterPhaseScope")
    {
        ActionSpace space{"Discrete", {2}};
        auto actorCritic = ActorCritic(3, space, 4);

        auto allRequireGrad = [](const std::vector<torch::Tensor> &parameters)
        {
            for (const auto &parameter : parameters)
            {
                if (!parameter.requires_grad())
                {
                    return false;
                }
            }
            return true;
        };
        auto noneRequireGrad = [](const std::vector<torch::Tensor> &parameters)
        {
            for (const auto &parameter : parameters)
            {
                if (parameter.requires_grad())
                {
                    return false;
                }
            }
            return true;
        };

        SUBCASE("Policy phase freezes the critic and restores it on exit")
        {
            {
                ParameterPhaseScope scope(ComputationPhase::Policy, *actorCritic);
                CHECK(scope.getPhase() == ComputationPhase::Policy);
                CHECK(noneRequireGrad(actorCritic->criticParameters()));
                CHECK(allRequireGrad(actorCritic->policyParameters()));
            }
            CHECK(allRequireGrad(actorCritic->criticParameters()));
        }

        SUBCASE("Critic phase freezes the policy group")
        {
            {
                ParameterPhaseScope scope(ComputationPhase::Critic, *actorCritic);
                CHECK(noneRequireGrad(actorCritic->policyParameters()));
                CHECK(allRequireGrad(actorCritic->criticParameters()));
            }
            CHECK(allRequireGrad(actorCritic->policyParameters()));
        }

        SUBCASE("Temperature phase freezes every network parameter")
        {
            {
                ParameterPhaseScope scope(ComputationPhase::Temperature, *actorCritic);
                CHECK(noneRequireGrad(actorCritic->parameters()));
            }
            CHECK(allRequireGrad(actorCritic->parameters()));
        }

        SUBCASE("Flags are restored when the phase exits through an exception")
        {
            auto failingPhase = [&]()
            {
                ParameterPhaseScope scope(ComputationPhase::Policy, *actorCritic);
                throw std::runtime_error("shape mismatch");
            };
            CHECK_THROWS_AS(failingPhase(), std::runtime_error);
            CHECK(allRequireGrad(actorCritic->criticParameters()));
        }

        SUBCASE("Previously frozen parameters stay frozen")
        {
            auto q1Parameters = actorCritic->getQ1().parameters();
            q1Parameters[0].requires_grad_(false);
            {
                ParameterPhaseScope scope(ComputationPhase::Policy, *actorCritic);
            }
            CHECK(!q1Parameters[0].requires_grad());
            CHECK(q1Parameters[1].requires_grad());
        }
    }
}
