#pragma once
//
// Created by moinshaikh on 2/11/26.
//

#ifndef METASAC_BANDITENVIRONMENT_HPP
#define METASAC_BANDITENVIRONMENT_HPP

#include"Environment.hpp"

namespace MetaSac
{
    /**
     * @class BanditEnvironment
     * @brief Multi-armed Bernoulli bandit presented as a sequence of pulls.
     *
     * Every arm pays 1 with its own probability. A trial lasts `pullsPerTrial` steps and is
     * truncated afterwards. The arm probabilities form the task: they are redrawn uniformly
     * from [0, 1) every `trialsPerTask` resets, so a recurrent agent has to identify the
     * best arm from its own (action, reward) history. The observation is a constant.
     */
    class BanditEnvironment : public Environment
    {
    private:
        int64_t arms;
        int64_t pullsPerTrial;
        int64_t trialsPerTask;
        int64_t pulls;
        int64_t resets;
        torch::Tensor armProbabilities;  ///< [arms]
    public:
        BanditEnvironment(int64_t numArms, int64_t pullsPerTrial, int64_t trialsPerTask);

        torch::Tensor reset() override;

        /**
         * @throws std::runtime_error for arms outside the action space.
         */
        StepResult step(int64_t action) override;

        ActionSpace actionSpace() const override;

        std::vector<int64_t> observationShape() const override;

        /** @brief Draws new arm probabilities */
        void resampleTask();

        inline const torch::Tensor &getArmProbabilities() const
        {
            return armProbabilities;
        }
    };
}

#endif //METASAC_BANDITENVIRONMENT_HPP
