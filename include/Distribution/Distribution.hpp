#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef METASAC_DISTRIBUTION_HPP
#define METASAC_DISTRIBUTION_HPP

#include<torch/torch.h>

namespace MetaSac
{
    /**
     * @class Distribution
     * @brief Abstract action distribution produced by a policy head.
     *
     * Every method works on a batch of distributions, one per row of the head's input.
     *
     * @see Categorical
    */
    class Distribution
    {
    public:
        virtual ~Distribution() = 0;

        /**
         * @brief Entropy of every distribution of the batch.
         *
         * @return Tensor of shape [batch, 1], in nats.
         */
        virtual torch::Tensor entropy() = 0;

        /** @brief One random draw per distribution, shape [batch] */
        virtual torch::Tensor sample() = 0;

        /**
         * @brief Most probable value of every distribution, shape [batch].
         *
         * Used for greedy action selection.
         */
        virtual torch::Tensor mode() = 0;
    };

    inline Distribution::~Distribution() {

    }
}

#endif //METASAC_DISTRIBUTION_HPP
