#pragma once
//
// Created by moinshaikh on 2/13/26.
//

#ifndef METASAC_TRAININGLOOP_HPP
#define METASAC_TRAININGLOOP_HPP

#include<chrono>
#include<cstdint>

#include<torch/torch.h>

#include"Algorithms/Sac.hpp"
#include"Config.hpp"
#include"Environment/Environment.hpp"
#include"EpisodicBuffer.hpp"
#include"EpochLogger.hpp"
#include"Model/ActorCritic.hpp"

namespace MetaSac
{
    /**
     * @class TrainingLoop
     * @brief Meta-training rollout: epochs of trajectories on one environment.
     *
     * One epoch is one task instance. The recurrent state is zeroed at the start of an
     * epoch and carried across its trajectories, so the agent can adapt within the task.
     * Every `updateEvery` trajectories the trainer runs one update, the row of metrics is
     * written and, every `saveEveryNUpdate` updates, a checkpoint is saved. At the end of
     * an epoch the buffer is emptied and the learning rate decays one step.
     *
     * All collaborators are owned by the caller and must outlive the loop.
     */
    class TrainingLoop
    {
    private:
        Environment &environment;
        ActorCritic &actorCritic;
        Sac &sac;
        EpisodicBuffer &buffer;
        EpochLogger &logger;
        const SacConfig &config;
        TrainerState &state;
        torch::Tensor hidden;                                ///< Recurrent state carried between steps
        std::chrono::steady_clock::time_point startTime;

        void logTrial(int64_t trajectory);
    public:
        TrainingLoop(Environment &environment,
                     ActorCritic &actorCritic,
                     Sac &sac,
                     EpisodicBuffer &buffer,
                     EpochLogger &logger,
                     const SacConfig &config,
                     TrainerState &state);

        /**
         * @brief Runs the remaining epochs, from `state.currentEpoch` to `config.epochs`
         */
        void run();

        /**
         * @brief Collects `numberOfTrajectories` trajectories on the current task
         */
        void runEpoch();

        /**
         * @brief Plays one trajectory and closes it in the buffer
         *
         * The prior action and reward restart at 0; the recurrent state continues from the
         * previous trajectory of the epoch.
         */
        void runTrajectory();
    };
}

#endif //METASAC_TRAININGLOOP_HPP
