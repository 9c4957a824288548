#pragma once
//
// Created by moinshaikh on 1/27/26.
//



#ifndef METASAC_GENERATOR_HPP
#define METASAC_GENERATOR_HPP

#include<vector>
#include<torch/torch.h>

namespace MetaSac
{
    /**
     * @struct EpisodeBatch
     * @brief All transitions of one stored episode, in time order.
     *
     * Every tensor has the episode length T as its first dimension. The recurrent
     * snapshots are the states recorded while acting; replays start from row 0.
    */
    struct EpisodeBatch
    {
        torch::Tensor observations;       /**< @brief [T, obs_dim] observation seen before acting. */
        torch::Tensor nextObservations;   /**< @brief [T, obs_dim] observation returned by the step. */
        torch::Tensor actions;            /**< @brief [T] (kLong) action taken. */
        torch::Tensor rewards;            /**< @brief [T, 1] reward received. */
        torch::Tensor dones;              /**< @brief [T, 1] 1 when the step ended the episode, 0 otherwise. */
        torch::Tensor prevActions;        /**< @brief [T] (kLong) action of the previous step, 0 at the start. */
        torch::Tensor prevRewards;        /**< @brief [T, 1] reward of the previous step, 0 at the start. */
        torch::Tensor hiddenIn;           /**< @brief [T, hidden] recurrent state before the step. */
        torch::Tensor hiddenOut;          /**< @brief [T, hidden] recurrent state after the step. */

        /**
         * @brief Default constructor.
         *
         * Creates an empty EpisodeBatch with undefined tensors.
        */
        EpisodeBatch() {}

        EpisodeBatch(
          torch::Tensor observations,
          torch::Tensor nextObservations,
          torch::Tensor actions,
          torch::Tensor rewards,
          torch::Tensor dones,
          torch::Tensor prevActions,
          torch::Tensor prevRewards,
          torch::Tensor hiddenIn,
          torch::Tensor hiddenOut
        ) :
        observations(observations),
        nextObservations(nextObservations),
        actions(actions),
        rewards(rewards),
        dones(dones),
        prevActions(prevActions),
        prevRewards(prevRewards),
        hiddenIn(hiddenIn),
        hiddenOut(hiddenOut)
        {
        }

        /** @return Number of transitions in the episode */
        inline int64_t length() const
        {
            return observations.defined() ? observations.size(0) : 0;
        }

        /** @return A copy of the episode with every tensor on `device` */
        inline EpisodeBatch to(torch::Device device) const
        {
            return EpisodeBatch(observations.to(device),
                                nextObservations.to(device),
                                actions.to(device),
                                rewards.to(device),
                                dones.to(device),
                                prevActions.to(device),
                                prevRewards.to(device),
                                hiddenIn.to(device),
                                hiddenOut.to(device));
        }
    };

    /**
     * @class Generator
     * @brief Abstract base class for producing the episodes of one update.
     */

    class Generator
    {
    public:
        /**
        * @brief Virtual destructor for proper cleanup of derived classes.
        */
        virtual ~Generator();

        /**
         * @brief Check if there are more episodes to generate.
         *
         * @return true if all episodes have been consumed
        */
        virtual bool done() const = 0;

        /**
         * @brief Retrieve the next episode.
         *
         * This method should be called only when done() returns false.
        */
        virtual EpisodeBatch next() = 0;
    };

    inline Generator::~Generator() {}
}

#endif //METASAC_GENERATOR_HPP
