#pragma once
//
// Created by moinshaikh on 2/9/26.
//

#ifndef METASAC_ENTROPYTEMPERATURE_HPP
#define METASAC_ENTROPYTEMPERATURE_HPP

#include<memory>

#include<torch/torch.h>

namespace MetaSac
{
    /**
     * @class EntropyTemperature
     * @brief Controller of the SAC entropy coefficient alpha.
     *
     * Either a constant, or learned as alpha = exp(log_alpha) with its own Adam optimizer so
     * that the policy's log-probabilities track
     * target_entropy = entropy_target_mult * log(|A|).
     */
    class EntropyTemperature
    {
    private:
        bool learned;
        double fixedAlpha;
        double targetEntropy;
        torch::Tensor logAlpha;                            ///< Shape [1]; only defined when learned
        std::unique_ptr<torch::optim::Adam> optimizer;     ///< Only allocated when learned
    public:
        /**
         * @param learned Learn log_alpha instead of keeping `fixedAlpha`.
         * @param fixedAlpha Value of alpha when not learned.
         * @param numActions Size of the discrete action space.
         * @param entropyTargetMult Fraction of the maximum entropy log(|A|) used as target.
         * @param learningRate Adam learning rate for log_alpha.
         * @param device Device of the policy whose log-probabilities drive the update.
         */
        EntropyTemperature(bool learned,
            double fixedAlpha,
            int64_t numActions,
            double entropyTargetMult,
            double learningRate,
            torch::Device device = torch::kCPU);

        /** @return Current alpha, always >= 0 */
        double alpha() const;

        /**
         * @brief One optimizer step on log_alpha.
         *
         * alpha_loss = -mean(log_alpha * (logProbabilities + target_entropy)), with the
         * log-probabilities detached. When alpha is fixed nothing changes and a zero loss
         * is returned.
         *
         * @param logProbabilities Policy log-probabilities from the last policy step.
         * @return The alpha loss (scalar tensor).
         */
        torch::Tensor update(torch::Tensor logProbabilities);

        /**
         * @brief Replaces log_alpha in place, e.g. with a value loaded from a checkpoint.
         *
         * The optimizer keeps tracking the same tensor.
         *
         * @throws std::runtime_error when alpha is fixed or `value` is not a single element.
         */
        void setLogAlpha(torch::Tensor value);

        inline bool isLearned() const
        {
            return learned;
        }

        inline double getTargetEntropy() const
        {
            return targetEntropy;
        }

        /** @return log_alpha, undefined when alpha is fixed */
        inline torch::Tensor getLogAlpha() const
        {
            return logAlpha;
        }
    };
}

#endif //METASAC_ENTROPYTEMPERATURE_HPP
