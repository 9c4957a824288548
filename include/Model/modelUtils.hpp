//
// Created by moinshaikh on 1/28/26.
//

#ifndef METASAC_MODELUTILS_HPP
#define METASAC_MODELUTILS_HPP

#include<torch/nn.h>

#include<string>
#include<vector>

namespace MetaSac
{
    /**
     * @brief Fills `tensor` with a (semi) orthogonal matrix scaled by `gains`.
     *
     * Tensors with fewer than two dimensions are returned untouched.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gains);

    /**
     * @brief Initializes weights and biases for neural network parameters
     *
     * Weights (any parameter whose name contains "weight") receive an orthogonal
     * initialization scaled by `weightGain`; biases are set to `biasGain`.
     *
     * @param parameters Named parameters of the module to initialize, modified in place.
     * @param weightGain Gain applied to the orthogonal weight matrices.
     * @param biasGain Constant value written to every bias.
     */
    void  initWeights(torch::OrderedDict<std::string,torch::Tensor> parameters, double weightGain, double biasGain);

    /**
     * @brief Copies every online parameter into the matching target parameter.
     *
     * The two lists must be aligned (same length, same shapes, same order). Values are
     * copied, never shared, so later updates of one set do not leak into the other.
     *
     * @throws std::runtime_error if the lists are not aligned.
     */
    void hardUpdate(const std::vector<torch::Tensor> &online, const std::vector<torch::Tensor> &target);

    /**
     * @brief Exponential smoothing of target parameters toward online parameters.
     *
     * For every aligned pair: target <- polyak * target + (1 - polyak) * online.
     * Runs in place under torch::NoGradGuard, no autograd history is recorded.
     *
     * @param online Parameters of the network being optimized.
     * @param target Parameters of the slowly moving copy, modified in place.
     * @param polyak Smoothing coefficient in [0, 1]; 1 keeps the target unchanged.
     * @throws std::runtime_error if the lists are not aligned.
     */
    void polyakUpdate(const std::vector<torch::Tensor> &online, const std::vector<torch::Tensor> &target, double polyak);

    /** @return Total number of scalar values in `parameters` */
    int64_t countParameters(const std::vector<torch::Tensor> &parameters);

}


#endif //METASAC_MODELUTILS_HPP
