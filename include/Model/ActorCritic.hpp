//
// Created by moinshaikh on 1/28/26.
//

#ifndef METASAC_ACTORCRITIC_HPP
#define METASAC_ACTORCRITIC_HPP

#include<memory>
#include<string>
#include<utility>
#include<vector>

#include<torch/torch.h>
#include<torch/nn.h>
#include"MemoryEncoder.hpp"
#include"PolicyHead.hpp"
#include"QNetwork.hpp"
#include"../Space.hpp"

namespace MetaSac
{
    /**
     * @class ActorCriticImpl
     * @brief Recurrent discrete soft actor-critic network.
     *
     * ActorCriticImpl bundles the four sub-modules trained by the SAC update:
     * - `memory`: GRU encoder of (observation, previous action, previous reward)
     * - `pi`: categorical policy head acting on the memory embedding
     * - `q1`, `q2`: twin soft Q-networks acting on the raw observation
     *
     * Parameters are split in two groups that are optimized separately: the critic group
     * (q1 + q2) and the policy group (pi + memory).
     *
     * @note Wrapped with TORCH_MODULE, so copies of `ActorCritic` share one module. A target
     *       network must be a separately constructed instance.
     */
    class ActorCriticImpl : public torch::nn::Module
    {
    private:
        ActionSpace actionSpace;
        std::shared_ptr<MemoryEncoder> memory;
        std::shared_ptr<PolicyHead> pi;
        std::shared_ptr<QNetwork> q1;
        std::shared_ptr<QNetwork> q2;

        /**
         * @brief Runs the encoder for one environment step.
         *
         * @return {embedding [1, hidden_size], next hidden state [1, 1, hidden_size]}
         */
        std::vector<torch::Tensor> encodeStep(torch::Tensor observation,
            int64_t prevAction,
            double prevReward,
            torch::Tensor hidden);
    public:
        /**
         * @brief Constructs the actor-critic.
         *
         * @param observationSize Length of the flat observation vector.
         * @param actionSpace Action space of the environment; must be "Discrete".
         * @param hiddenSize Width of the recurrent state and of every hidden layer.
         *
         * @throws std::runtime_error if the action space is not discrete.
         */
        ActorCriticImpl(int64_t observationSize, ActionSpace actionSpace, int64_t hiddenSize);

        /**
         * @brief Greedy action for one step.
         *
         * @param observation Observation of shape [observation_size] or [1, observation_size].
         * @param prevAction Action taken at the previous step (0 at the start of a trajectory).
         * @param prevReward Reward received at the previous step (0 at the start of a trajectory).
         * @param hidden Recurrent state [1, 1, hidden_size] before this step.
         * @return {action (scalar kLong tensor), recurrent state after this step}
         *
         * @note Runs without gradient tracking.
         */
        std::vector<torch::Tensor> act(torch::Tensor observation,
            int64_t prevAction,
            double prevReward,
            torch::Tensor hidden);

        /**
         * @brief Stochastic action for one step, sampled from the policy distribution.
         *
         * Same arguments and outputs as act().
         */
        std::vector<torch::Tensor> explore(torch::Tensor observation,
            int64_t prevAction,
            double prevReward,
            torch::Tensor hidden);

        /**
         * @brief Advances the recurrent state without choosing an action.
         *
         * Used for steps whose action comes from elsewhere (random warm-up).
         */
        torch::Tensor advanceMemory(torch::Tensor observation,
            int64_t prevAction,
            double prevReward,
            torch::Tensor hidden);

        /** @return Parameters of q1 followed by q2 */
        std::vector<torch::Tensor> criticParameters() const;

        /** @return Parameters of pi followed by memory */
        std::vector<torch::Tensor> policyParameters() const;

        /** @return Number of scalar parameters of each sub-module, in the order pi, q1, q2, memory */
        std::vector<std::pair<std::string, int64_t>> parameterCounts() const;

        /** @return A zero recurrent state */
        torch::Tensor initialHidden() const;

        inline MemoryEncoder &getMemory() { return *memory; }
        inline PolicyHead &getPolicy() { return *pi; }
        inline QNetwork &getQ1() { return *q1; }
        inline QNetwork &getQ2() { return *q2; }

        inline torch::Device getDevice() const
        {
            return memory->getDevice();
        }

        inline int64_t getHiddenSize() const
        {
            return memory->getHiddenSize();
        }

        inline int64_t getNumActions() const
        {
            return numActions(actionSpace);
        }

        inline const ActionSpace &getActionSpace() const
        {
            return actionSpace;
        }
    };
    /**
     * @brief PyTorch module holder for ActorCriticImpl.
     *
     * Usage: auto actorCritic = ActorCritic(observation_size, action_space, hidden_size);
    */
    TORCH_MODULE(ActorCritic);
}




#endif //METASAC_ACTORCRITIC_HPP
