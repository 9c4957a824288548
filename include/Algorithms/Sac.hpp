#pragma once

//
// Created by moinshaikh on 2/10/26.
//

#ifndef METASAC_SAC_HPP
#define METASAC_SAC_HPP

#include<memory>
#include<vector>

#include<torch/torch.h>

#include"Algorithm.hpp"
#include"EntropyTemperature.hpp"
#include"../Config.hpp"
#include"../EpisodicBuffer.hpp"
#include"../Model/ActorCritic.hpp"

namespace MetaSac {

    /**
     * @class Sac
     * @brief Discrete soft actor-critic over whole recurrent episodes.
     *
     * @details
     * One call to update() runs, for every episode of a sampled batch:
     * - a critic step on q1 + q2 (policy parameters excluded),
     * - a policy step on pi + memory (critic parameters excluded),
     * - a temperature step on log_alpha when annealing is enabled,
     * and then a single polyak pass moving the target network toward the online one.
     *
     * Two Adam optimizers (critic and policy) share a step learning-rate schedule advanced
     * by decayLearningRate(). Gradients are clipped to `clipRatio` before every step.
     *
     * @see Algorithms - Base class defining the update interface
    */
    class Sac : public Algorithms
    {
    private:
        ActorCritic &actorCritic;                                ///< Online network, owned by the caller
        ActorCritic target;                                      ///< Separately built copy, updated only by polyak averaging
        const SacConfig &config;
        EntropyTemperature temperature;
        std::unique_ptr<torch::optim::Adam> criticOptimizer;     ///< Adam over q1 + q2
        std::unique_ptr<torch::optim::Adam> policyOptimizer;     ///< Adam over pi + memory
        int64_t scheduleSteps;                                   ///< Number of decayLearningRate() calls
    public:
        /**
         * @brief Builds the optimizers and the target network.
         *
         * If `config.modelFileToLoad` is set, the checkpoint is loaded into `actorCritic`
         * first; the target then starts as an exact, non-aliased copy of the online
         * parameters and never records gradients.
         *
         * @throws std::runtime_error on invalid hyperparameters or a missing checkpoint.
         */
        Sac(ActorCritic &actorCritic, const SacConfig &config);

        /**
         * @brief Performs one optimization cycle on `config.batchSize` sampled episodes.
         *
         * @return Per episode: LossQ, Q1Vals, Q2Vals, LossPi, LogPi, Entropy;
         *         once: Alpha, LossAlpha.
         */
        std::vector<UpdateDatum> update(EpisodicBuffer &buffer) override;

        /**
         * @brief Advances both learning-rate schedules by one epoch.
         *
         * lr = config.lr * gammaLr ^ floor(steps / epochsToUpdateLr)
         */
        void decayLearningRate();

        /** @return Learning rate currently used by the policy and critic optimizers */
        double getLearningRate() const;

        inline ActorCritic &getTarget()
        {
            return target;
        }

        inline EntropyTemperature &getTemperature()
        {
            return temperature;
        }
    };
}


#endif //METASAC_SAC_HPP
