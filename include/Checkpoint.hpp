#pragma once
//
// Created by moinshaikh on 2/12/26.
//

#ifndef METASAC_CHECKPOINT_HPP
#define METASAC_CHECKPOINT_HPP

#include<string>

#include<torch/torch.h>

#include"Model/ActorCritic.hpp"

namespace MetaSac
{
    /**
     * @brief Writes the full parameter set of `actorCritic`
     *
     * Files are written to `<directory>/pyt_save/model<tag>.pt` and, when `logAlpha` is
     * defined, `<directory>/pyt_save/log_alpha<tag>.pt`. Missing directories are created.
     *
     * @param tag Suffix identifying the checkpoint, e.g. "_<epoch>_<trajectory>"
     * @return Path of the model file
     */
    std::string saveCheckpoint(ActorCritic &actorCritic,
                               torch::Tensor logAlpha,
                               const std::string &directory,
                               const std::string &tag);

    /**
     * @brief Loads parameters written by saveCheckpoint() into `actorCritic`
     *
     * The module must have been built with the same observation size, action space and
     * hidden size as the saved one. Parameters are placed on the device `actorCritic`
     * already lives on.
     *
     * @throws std::runtime_error if `path` does not exist; errors raised by torch::load
     *         on corrupt or incompatible files propagate unchanged.
     */
    void loadCheckpoint(const std::string &path, ActorCritic &actorCritic);

    /**
     * @brief Path of the log_alpha file saved next to model file `modelPath`
     *
     * `<dir>/model_3_9.pt` maps to `<dir>/log_alpha_3_9.pt`. A file not named after the
     * `model` prefix maps to `<dir>/log_alpha_<filename>`.
     */
    std::string logAlphaCheckpointPath(const std::string &modelPath);

    /**
     * @brief Loads a log_alpha tensor written by saveCheckpoint()
     *
     * @throws std::runtime_error if `path` does not exist.
     */
    torch::Tensor loadLogAlpha(const std::string &path);
}

#endif //METASAC_CHECKPOINT_HPP
