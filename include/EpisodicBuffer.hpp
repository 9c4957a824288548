#pragma once
//
// Created by moinshaikh on 1/28/26.
//

#ifndef METASAC_EPISODICBUFFER_HPP
#define METASAC_EPISODICBUFFER_HPP

#include<memory>
#include<utility>
#include<vector>

#include<torch/torch.h>

#include"Generator/Generator.hpp"

namespace MetaSac
{
    /**
     * @brief Episode-structured replay storage for the recurrent SAC trainer
     *
     * `EpisodicBuffer` keeps pre-allocated tensors for every field of a transition.
     * Transitions are appended with store(); finishPath() closes the pending ones as one
     * episode. Updates sample whole episodes, with replacement, optionally favouring the
     * episodes that were drawn the least so far.
     *
     * The buffer holds one epoch worth of trajectories and is emptied by reset() when
     * the epoch (task) changes.
     */
    class EpisodicBuffer
    {
    private:
        torch::Tensor observations;      /**< [capacity, obs_dim] */
        torch::Tensor nextObservations;  /**< [capacity, obs_dim] */
        torch::Tensor actions;           /**< [capacity] kLong */
        torch::Tensor rewards;           /**< [capacity, 1] */
        torch::Tensor dones;             /**< [capacity, 1] */
        torch::Tensor prevActions;       /**< [capacity] kLong */
        torch::Tensor prevRewards;       /**< [capacity, 1] */
        torch::Tensor hiddenIn;          /**< [capacity, hidden] */
        torch::Tensor hiddenOut;         /**< [capacity, hidden] */
        torch::Device device;            /**< Device where tensors are stored */
        int64_t capacity;
        int64_t observationSize;
        int64_t hiddenSize;
        int64_t ptr;                     /**< Next free row */
        int64_t pathStart;               /**< First row of the episode being collected */
        bool explorationSampling;
        std::vector<std::pair<int64_t, int64_t>> episodes; /**< [begin, end) of every finished episode */
        std::vector<int64_t> sampleCounts;                 /**< Times each episode was drawn */

        /** @brief Picks one episode index and counts the draw. */
        int64_t drawEpisode(double pExploration);
    public:
        /**
         * @brief Allocates an empty buffer
         *
         * @param capacity Maximum number of transitions (trajectories per epoch * step limit)
         * @param observationSize Length of a flat observation
         * @param hiddenSize Size of the recurrent state snapshots
         * @param explorationSampling Whether get() may favour rarely drawn episodes
         * @param device Torch device where tensors will be allocated
         */
        EpisodicBuffer(int64_t capacity,
            int64_t observationSize,
            int64_t hiddenSize,
            bool explorationSampling = false,
            torch::Device device = torch::kCPU);

        /**
         * @brief Appends one transition to the pending episode
         *
         * @param observation Observation before acting, [obs_dim] or [1, obs_dim]
         * @param nextObservation Observation returned by the environment
         * @param action Action taken
         * @param reward Reward received
         * @param done Whether the step ended the episode (already forced false at the step limit)
         * @param prevAction Action of the previous step
         * @param prevReward Reward of the previous step
         * @param hiddenIn Recurrent state before the step, any shape with hidden elements
         * @param hiddenOut Recurrent state after the step
         *
         * @throws std::runtime_error when the buffer is full.
         */
        void store(torch::Tensor observation,
                   torch::Tensor nextObservation,
                   int64_t action,
                   double reward,
                   bool done,
                   int64_t prevAction,
                   double prevReward,
                   torch::Tensor hiddenIn,
                   torch::Tensor hiddenOut);

        /**
         * @brief Closes the transitions stored since the last call as one episode
         *
         * @throws std::runtime_error if no transition is pending.
         */
        void finishPath();

        /**
         * @brief Selects `batchSize` episodes and returns a generator over them
         *
         * Draws are with replacement. When exploration sampling is enabled, each draw
         * takes the least sampled episode (lowest index on ties) with probability
         * `pExploration`, and a uniform episode otherwise.
         *
         * @throws std::runtime_error if no episode has been finished yet.
         */
        std::unique_ptr<Generator> episodeGenerator(int64_t batchSize, double pExploration);

        /**
         * @brief Same selection as episodeGenerator(), collected into a vector
         */
        std::vector<EpisodeBatch> get(int64_t batchSize, double pExploration);

        /**
         * @brief Drops every stored transition and episode
         */
        void reset();

        /** @return Number of stored transitions, including the pending ones */
        inline int64_t size() const
        {
            return ptr;
        }

        /** @return Number of finished episodes */
        inline int64_t numEpisodes() const
        {
            return static_cast<int64_t>(episodes.size());
        }

        /** @return Number of transitions not yet closed by finishPath() */
        inline int64_t pendingSteps() const
        {
            return ptr - pathStart;
        }

        /** @return How many times episode `episode` was drawn since the last reset */
        int64_t sampleCount(int64_t episode) const;

        inline int64_t getCapacity() const
        {
            return capacity;
        }
    };
}




#endif //METASAC_EPISODICBUFFER_HPP
