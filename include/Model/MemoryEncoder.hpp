//
// Created by moinshaikh on 1/28/26.
//

#ifndef METASAC_MEMORYENCODER_HPP
#define METASAC_MEMORYENCODER_HPP
#include<torch/torch.h>
#include<torch/nn.h>
#include<vector>

namespace MetaSac
{
    /**
     * @brief Recurrent encoder of the interaction history
     *
     * `MemoryEncoder` runs a single layer GRU over the concatenation of the current
     * observation, the one-hot previous action and the previous reward. Its output is the
     * embedding the policy head acts on, and its hidden state is what carries task
     * information across the steps of a trial.
     *
     * The same module serves both acting (sequence length 1) and training (a whole
     * stored episode replayed as one sequence from its first hidden snapshot).
     */
    class MemoryEncoder : public torch::nn::Module
    {
    private:
        torch::nn::GRU gatedRecurrentUnit; // GRU Module for Recurrent processing
        int64_t observationSize;
        int64_t numActions;
        int64_t hiddenSize;
    public:
        /**
         * @brief Constructs the encoder
         *
         * @param observationSize Length of the flat observation vector
         * @param numActions Number of discrete actions, width of the one-hot encoding
         * @param hiddenSize Size of the hidden state and of the produced embedding
        */
        MemoryEncoder(int64_t observationSize,
            int64_t numActions,
            int64_t hiddenSize);

        /**
         * @brief Encodes a sequence of steps
         *
         * @param observations Observation tensor of shape [T, observationSize]
         * @param prevActions Previous actions, integer tensor of shape [T]
         * @param prevRewards Previous rewards of shape [T] or [T, 1]
         * @param hidden Hidden state before the first step, shape [1, 1, hiddenSize]
         * @return {embedding [T, hiddenSize], hidden state after the last step [1, 1, hiddenSize]}
         */
        std::vector<torch::Tensor> forward(torch::Tensor observations,
            torch::Tensor prevActions,
            torch::Tensor prevRewards,
            torch::Tensor hidden);

        /** @return A zero hidden state of shape [1, 1, hiddenSize], on the device of the GRU */
        torch::Tensor initialHidden() const;

        /** @return Device holding the GRU weights */
        torch::Device getDevice() const;

        inline int64_t getHiddenSize() const
        {
            return hiddenSize;
        }

        inline int64_t getInputSize() const
        {
            return observationSize + numActions + 1;
        }
    };
 }

#endif //METASAC_MEMORYENCODER_HPP
