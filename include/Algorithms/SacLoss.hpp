#pragma once
//
// Created by moinshaikh on 2/9/26.
//

#ifndef METASAC_SACLOSS_HPP
#define METASAC_SACLOSS_HPP

#include<vector>

#include<torch/torch.h>

#include"../Generator/Generator.hpp"
#include"../Model/ActorCritic.hpp"

namespace MetaSac
{
    /**
     * @brief Soft Bellman loss of the twin Q-networks on one episode
     *
     * - q1, q2: online Q-values of the taken actions.
     * - Without gradient: the online memory encoder is replayed over the next observations
     *   from the episode's first `hiddenOut` snapshot, giving pi2 and logp2 for every action;
     *   q_targ = min(target q1, target q2) on the next observations.
     * - next_v = sum_a pi2(a) * (q_targ(a) - alpha * logp2(a))
     * - backup = reward + gamma * (1 - done) * next_v
     * - loss = mean((q1 - backup)^2) + mean((q2 - backup)^2)
     *
     * @param actorCritic Online network.
     * @param target Target network; only queried without gradient.
     * @param episode One stored episode.
     * @param gamma Discount factor.
     * @param alpha Current entropy temperature.
     * @return {loss, Q1 of the taken actions [T, 1], Q2 of the taken actions [T, 1]};
     *         the Q-values are detached.
     *
     * @throws std::runtime_error if the reward, done and bootstrap tensors differ in shape.
     */
    std::vector<torch::Tensor> computeCriticLoss(ActorCritic &actorCritic,
        ActorCritic &target,
        const EpisodeBatch &episode,
        double gamma,
        double alpha);

    /**
     * @brief Soft policy loss on one episode
     *
     * The memory encoder is replayed with gradient from the episode's first `hiddenIn`
     * snapshot, so the loss trains both the policy head and the encoder. Q-values are
     * computed without gradient.
     *
     * loss = mean(-sum_a pi(a) * min(q1, q2)(a) - alpha * entropy)
     *
     * @return {loss, log-probabilities [T, |A|], entropy [T, 1]}
     */
    std::vector<torch::Tensor> computePolicyLoss(ActorCritic &actorCritic,
        const EpisodeBatch &episode,
        double alpha);
}

#endif //METASAC_SACLOSS_HPP
