#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef METASAC_EPISODEGENERATOR_HPP
#define METASAC_EPISODEGENERATOR_HPP

#include<utility>
#include<vector>

#include<torch/torch.h>
#include "Generator.hpp"

namespace MetaSac
{
    /**
     * @class EpisodeGenerator
     * @brief Yields whole stored episodes as EpisodeBatch slices.
     *
     * @details The generator receives the buffer's flat transition tensors together with the
     * `[begin, end)` bounds of the episodes chosen for this update. Each call to next() narrows
     * every tensor to the next episode; no data is copied.
     *
     * @see Generator
     * @see EpisodicBuffer
     */
    class EpisodeGenerator : public Generator
    {
    private:
        torch::Tensor observations;
        torch::Tensor nextObservations;
        torch::Tensor actions;
        torch::Tensor rewards;
        torch::Tensor dones;
        torch::Tensor prevActions;
        torch::Tensor prevRewards;
        torch::Tensor hiddenIn;
        torch::Tensor hiddenOut;

        /**
         * @brief Bounds of the episodes to emit, in emission order. May repeat.
         */
        std::vector<std::pair<int64_t, int64_t>> episodes;

        /**
         * @brief Position of the next episode in `episodes`.
         */
        size_t index;
    public:
        EpisodeGenerator(
            std::vector<std::pair<int64_t, int64_t>> episodes,
            torch::Tensor observations,
            torch::Tensor nextObservations,
            torch::Tensor actions,
            torch::Tensor rewards,
            torch::Tensor dones,
            torch::Tensor prevActions,
            torch::Tensor prevRewards,
            torch::Tensor hiddenIn,
            torch::Tensor hiddenOut
        );

        /**
         * @brief Checks whether every selected episode has been emitted.
         *
         * @code
         * while (!generator.done()) {
         *     EpisodeBatch episode = generator.next();
         *     // Process episode
         * }
         * @endcode
        */
        virtual bool done() const;

        /**
         * @brief Retrieves the next selected episode.
         *
         * @throws std::runtime_error when called after done() returned true.
         */
        virtual EpisodeBatch next();
    };
}

#endif //METASAC_EPISODEGENERATOR_HPP
