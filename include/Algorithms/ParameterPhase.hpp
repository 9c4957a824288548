#pragma once
//
// Created by moinshaikh on 2/10/26.
//

#ifndef METASAC_PARAMETERPHASE_HPP
#define METASAC_PARAMETERPHASE_HPP

#include<vector>

#include<torch/torch.h>

#include"../Model/ActorCritic.hpp"

namespace MetaSac
{
    /**
     * @brief Stage of one SAC optimization cycle
     */
    enum class ComputationPhase
    {
        Critic,      ///< q1 and q2 are optimized; policy parameters excluded
        Policy,      ///< pi and memory are optimized; critic parameters excluded
        Temperature  ///< only log_alpha is optimized; every network parameter excluded
    };

    /**
     * @brief Excludes the parameter groups a phase does not optimize from gradient recording
     *
     * The constructor records the current `requires_grad` flag of every excluded parameter
     * and clears it; the destructor puts back the recorded flags, also when the phase is left
     * through an exception.
     *
     * @code
     * {
     *     ParameterPhaseScope scope(ComputationPhase::Policy, *actorCritic);
     *     auto loss = computePolicyLoss(actorCritic, episode, alpha)[0];
     *     loss.backward();   // no gradient is accumulated on q1 / q2
     * }
     * @endcode
     */
    class ParameterPhaseScope
    {
    private:
        ComputationPhase phase;
        std::vector<torch::Tensor> excluded;
        std::vector<bool> previousFlags;
    public:
        ParameterPhaseScope(ComputationPhase phase, ActorCriticImpl &actorCritic);
        ~ParameterPhaseScope();

        ParameterPhaseScope(const ParameterPhaseScope &) = delete;
        ParameterPhaseScope &operator=(const ParameterPhaseScope &) = delete;

        inline ComputationPhase getPhase() const
        {
            return phase;
        }
    };
}

#endif //METASAC_PARAMETERPHASE_HPP
