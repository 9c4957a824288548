#pragma once
//
// Created by moinshaikh on 2/11/26.
//

#ifndef METASAC_FIXEDHORIZONENVIRONMENT_HPP
#define METASAC_FIXEDHORIZONENVIRONMENT_HPP

#include"Environment.hpp"

namespace MetaSac
{
    /**
     * @class FixedHorizonEnvironment
     * @brief Deterministic task: reward 1 for one chosen action, episodes of fixed length.
     *
     * The observation is {elapsed fraction of the episode, 1}. After `horizon` steps the
     * episode either terminates or is truncated, depending on `terminateAtHorizon`.
     */
    class FixedHorizonEnvironment : public Environment
    {
    private:
        int64_t actions;
        int64_t horizon;
        int64_t rewardedAction;
        bool terminateAtHorizon;
        int64_t elapsed;

        torch::Tensor observe() const;
    public:
        FixedHorizonEnvironment(int64_t numActions,
            int64_t horizon,
            int64_t rewardedAction = 0,
            bool terminateAtHorizon = true);

        torch::Tensor reset() override;

        /**
         * @throws std::runtime_error for actions outside the action space.
         */
        StepResult step(int64_t action) override;

        ActionSpace actionSpace() const override;

        std::vector<int64_t> observationShape() const override;
    };
}

#endif //METASAC_FIXEDHORIZONENVIRONMENT_HPP
