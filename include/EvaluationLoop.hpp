#pragma once
//
// Created by moinshaikh on 2/13/26.
//

#ifndef METASAC_EVALUATIONLOOP_HPP
#define METASAC_EVALUATIONLOOP_HPP

#include<vector>

#include<torch/torch.h>

#include"Config.hpp"
#include"Environment/Environment.hpp"
#include"EpochLogger.hpp"
#include"Model/ActorCritic.hpp"

namespace MetaSac
{
    /**
     * @brief Observations and rewards seen during evaluation, one entry per trajectory
     */
    struct EvaluationTrace
    {
        std::vector<std::vector<torch::Tensor>> observations;  ///< Observation returned by every step
        std::vector<std::vector<double>> rewards;
    };

    /**
     * @class EvaluationLoop
     * @brief Plays held-out trajectories with a blend of greedy and sampled actions.
     *
     * Each trajectory starts from a zero recurrent state. Before acting, `randomInit`
     * uniformly random steps are applied to the environment; they do not reach the
     * memory. Afterwards each step is greedy with probability `greedyRatio`.
     */
    class EvaluationLoop
    {
    private:
        Environment &environment;
        ActorCritic &actorCritic;
        EpochLogger &logger;
        const SacConfig &config;
        TrainerState &state;

        torch::Tensor warmUp(torch::Tensor observation);
    public:
        EvaluationLoop(Environment &environment,
                       ActorCritic &actorCritic,
                       EpochLogger &logger,
                       const SacConfig &config,
                       TrainerState &state);

        /**
         * @brief Evaluates `numTestEpisodes` trajectories
         *
         * TestEpRew and TestEpLen are stored per trajectory and summarised through spdlog
         * and the metrics.jsonl series at the end. The evaluated weights are then saved as
         * `<outputDirectory>/pyt_save/model.pt`.
         */
        EvaluationTrace run();
    };
}

#endif //METASAC_EVALUATIONLOOP_HPP
