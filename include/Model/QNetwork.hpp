//
// Created by moinshaikh on 1/28/26.
//

#ifndef METASAC_QNETWORK_HPP
#define METASAC_QNETWORK_HPP


#include<torch/nn.h>



namespace MetaSac
{
    /**
     * @brief Multi-layer perceptron estimating one soft Q-value per discrete action
     *
     * Two tanh hidden layers followed by a linear output of width |A|. The actor-critic
     * holds two independent instances (q1, q2) and the losses use their element-wise
     * minimum to curb overestimation.
     */
    class QNetwork : public torch::nn::Module
    {
    private:
        torch::nn::Sequential trunk;     /**< Two Dense + tanh layers */
        torch::nn::Linear qLinear;       /**< Final linear layer, one output per action */
        int64_t numInputs;

    public:
        /**
         * @param numInputs Dimensionality of the observation.
         * @param numActions Number of discrete actions.
         * @param hiddenSize Width of both hidden layers.
        */
        QNetwork(int64_t numInputs,
            int64_t numActions,
            int64_t hiddenSize = 64);

        /**
        * @brief Q-values for a batch of observations
        *
        * @param inputs Observation tensor of shape [batch_size, num_inputs]
        * @return Q-values of shape [batch_size, num_actions]
        */
        torch::Tensor forward(torch::Tensor inputs);

        inline int64_t getNumInputs() const
        {
            return numInputs;
        }
    };
}
#endif //METASAC_QNETWORK_HPP
