#pragma once

//
// Created by moinshaikh on 1/28/26.
//

#ifndef METASAC_ALGORITHM_HPP
#define METASAC_ALGORITHM_HPP
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../EpisodicBuffer.hpp"

namespace MetaSac
{
    /**
     * @brief Data structure for storing algorithm training metrics
     *
     * `UpdateDatum` encapsulates one metric produced during a training update step.
     * Each metric is identified by a name (for logging and monitoring) and carries a
     * detached tensor; losses are 0-d, per-step quantities keep every element.
     *
     * The SAC update emits one datum per episode for LossQ, Q1Vals, Q2Vals, LossPi,
     * LogPi and Entropy, and one per update for Alpha and LossAlpha. The EpochLogger
     * aggregates every element by name.
     */
    struct UpdateDatum
    {
        std::string name; /**< Identifier for this metric (e.g., "LossQ", "LossPi"). */
        torch::Tensor value; /**< Detached metric values, any shape. */
    };

    /**
     * @brief Abstract base class for off-policy episodic learners
     *
     * The algorithm pattern:
     * 1. Collect trajectories through environment interaction (TrainingLoop)
     * 2. Store them, one finished path per trajectory, in an EpisodicBuffer
     * 3. Call update() with the buffer to perform gradient updates
     * 4. Receive training metrics for monitoring
     */
    class Algorithms
    {
    public:
        virtual ~Algorithms() = 0;


        /**
         * @brief Performs one optimization cycle on episodes drawn from `buffer`
         *
         * @param buffer Buffer holding at least one finished episode.
         * @return Vector of UpdateDatum objects containing training metrics from this update.
         *
         * @throws std::runtime_error on invariant violations (e.g. mismatched tensor shapes).
         *         Parameters already stepped inside the cycle are kept.
         */
        virtual std::vector<UpdateDatum> update(EpisodicBuffer &buffer) = 0;
    };
    inline Algorithms::~Algorithms() {}
}


#endif //METASAC_ALGORITHM_HPP
