#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef METASAC_CONFIG_HPP
#define METASAC_CONFIG_HPP

#include<cstdint>
#include<string>

#include<msgpack.hpp>

namespace MetaSac
{
    /**
     * @brief Hyperparameters of the recurrent SAC trainer
     *
     * One instance is created by the application and passed by reference to the
     * trainer, the training loop and the evaluation loop. Defaults reproduce the
     * reference meta-RL setup (2000 step horizon, 100 trajectories per epoch,
     * an update every 50 trajectories).
     */
    struct SacConfig
    {
        int64_t seed = 42;                  ///< Seed for torch's global generator
        int64_t maxEpLen = 2000;            ///< Step limit of one trajectory
        int64_t saveEveryNUpdate = 1;       ///< Checkpoint every N updates (in units of updateEvery trajectories)
        double gamma = 0.99;                ///< Discount factor
        double lr = 1e-4;                   ///< Initial learning rate of every optimizer
        double gammaLr = 0.5;               ///< Multiplicative learning rate decay
        int64_t epochsToUpdateLr = 2;       ///< Epochs between two learning rate decays
        double polyak = 0.995;              ///< Target smoothing coefficient
        int64_t epochs = 1;                 ///< Number of meta-training epochs (task instances)
        int64_t batchSize = 16;             ///< Episodes sampled per update
        int64_t hiddenSize = 256;           ///< Recurrent state / hidden layer width
        int64_t startSteps = 1000;          ///< Uniform random actions until the global step count exceeds this
        int64_t updateEvery = 50;           ///< Trajectories between two updates
        bool explorationSampling = false;   ///< Favour rarely sampled episodes when drawing a batch
        double pExploration = 0.1;          ///< Probability of an exploration draw when explorationSampling is set
        double clipRatio = 1.0;             ///< Maximum global gradient norm
        int64_t numberOfTrajectories = 100; ///< Trajectories per epoch
        bool useAlphaAnnealing = false;     ///< Learn the entropy temperature
        double entropyTargetMult = 0.98;    ///< Target entropy as a fraction of log(|A|)
        double fixedAlpha = 0.2;            ///< Entropy temperature when annealing is off
        bool greedyRollouts = false;        ///< Act greedily instead of sampling after warm-up
        int64_t numTestEpisodes = 10;       ///< Evaluation trajectories
        int64_t randomInit = 1000;          ///< Random warm-up steps before each evaluation trajectory
        double greedyRatio = 0.8;           ///< Probability of a greedy step during evaluation
        std::string modelFileToLoad;        ///< Checkpoint to start from; empty for a fresh model
        std::string outputDirectory = "runs/meta_sac";

        MSGPACK_DEFINE_MAP(seed, maxEpLen, saveEveryNUpdate, gamma, lr, gammaLr, epochsToUpdateLr,
                           polyak, epochs, batchSize, hiddenSize, startSteps, updateEvery,
                           explorationSampling, pExploration, clipRatio, numberOfTrajectories,
                           useAlphaAnnealing, entropyTargetMult, fixedAlpha, greedyRollouts,
                           numTestEpisodes, randomInit, greedyRatio, modelFileToLoad, outputDirectory);
    };

    /**
     * @brief Mutable counters shared by the training and evaluation loops
     */
    struct TrainerState
    {
        int64_t globalSteps = 0;
        int64_t globalTestSteps = 0;
        int64_t totalTrajectories = 0;
        int64_t currentEpoch = 0;
        int64_t currentTestEpoch = 0;
        int64_t updateCounter = 0;
    };
}

#endif //METASAC_CONFIG_HPP
