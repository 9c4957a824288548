//
// Created by moinshaikh on 1/28/26.
//

#ifndef METASAC_POLICYHEAD_HPP
#define METASAC_POLICYHEAD_HPP

#include<torch/torch.h>
#include<torch/nn.h>
#include<memory>
#include<vector>

#include"../Distribution/Categorical.hpp"

namespace MetaSac {
    /**
        * @class PolicyHead
        * @brief Output layer that turns a memory embedding into a Categorical distribution.
        *
        * A single linear transformation maps the embedding to one logit per action; the
        * Categorical distribution normalises them. The soft actor-critic losses use the whole
        * distribution, so sample() also returns the probability and log-probability of every
        * action, not only of the sampled one.
       */
    class PolicyHead : public torch::nn::Module
    {
    private:
        /**
         * @brief Linear layer for feature transformation.
         *
         * Maps from num_inputs features to num_outputs logit values, one for each possible action.
        */
        torch::nn::Linear linear;
    public:
        /**
         * @brief Constructor for PolicyHead layer.
         *
         * @param numInputs Width of the memory embedding.
         * @param numOutputs Number of discrete actions available to the agent.
         */
        PolicyHead(int64_t numInputs, int64_t numOutputs);

        /**
         * @brief Computes the Categorical distribution for a batch of embeddings.
         *
         * @param x Input tensor of shape (batch_size, num_inputs).
         */
        std::unique_ptr<Categorical> forward(torch::Tensor x);

        /**
         * @brief Samples one action per row and exposes the full distribution.
         *
         * @param embedding Tensor of shape (batch_size, num_inputs).
         * @return {action [batch_size] (kLong), probabilities [batch_size, num_outputs],
         *          log-probabilities [batch_size, num_outputs], entropy [batch_size, 1]}
         */
        std::vector<torch::Tensor> sample(torch::Tensor embedding);

        /** @return Arg-max action of every row, shape [batch_size] */
        torch::Tensor greedy(torch::Tensor embedding);
    };
}



#endif //METASAC_POLICYHEAD_HPP
