#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef METASAC_CATEGORICAL_HPP
#define METASAC_CATEGORICAL_HPP

#include"Distribution.hpp"

namespace MetaSac
{
    /**
    * @class Categorical
    * @brief Batch of categorical distributions over the discrete actions.
    *
    * Built by the policy head from raw logits of shape [batch, numActions]. The soft
    * actor-critic losses take expectations over every action, so besides sampling the
    * distribution exposes the full probability and log-probability rows.
    */
    class Categorical : public Distribution
    {
    private:
        torch::Tensor probabilities;      ///< [batch, numActions]
        torch::Tensor logProbabilities;   ///< [batch, numActions], normalised with log-sum-exp
        int64_t numActions;
    public:
        /**
         * @param logits Unnormalised scores, the last dimension indexes the actions.
         * @throws std::runtime_error if `logits` has no dimension.
         */
        explicit Categorical(torch::Tensor logits);

        /** @return -sum(p * log p) over the actions, shape [batch, 1] */
        torch::Tensor entropy() override;

        /**
         * @brief Draws one action per row with torch::multinomial.
         *
         * The draw is not differentiable; the result is kLong with the batch shape.
        */
        torch::Tensor sample() override;

        torch::Tensor mode() override;

        inline torch::Tensor getProbabilities() { return probabilities; }
        inline torch::Tensor getLogProbabilities() { return logProbabilities; }

        inline int64_t getNumActions() const
        {
            return numActions;
        }
    };
}

#endif //METASAC_CATEGORICAL_HPP
