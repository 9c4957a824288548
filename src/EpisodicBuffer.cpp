//
// Created by moinshaikh on 2/2/26.
//

#include<algorithm>
#include<memory>
#include<stdexcept>
#include<vector>

#include"../include/EpisodicBuffer.hpp"
#include"../include/Generator/EpisodeGenerator.hpp"
#include<doctest/doctest.h>

namespace MetaSac
{
    /**
     * @brief Constructs an EpisodicBuffer object.
     *
     * @details Initializes all storage tensors with zeros. Actions are kLong, every
     * scalar per-step quantity is stored as a [capacity, 1] column.
     */
    EpisodicBuffer::EpisodicBuffer(int64_t capacity,
        int64_t observationSize,
        int64_t hiddenSize,
        bool explorationSampling,
        torch::Device device) :
    device(device),
    capacity(capacity),
    observationSize(observationSize),
    hiddenSize(hiddenSize),
    ptr(0),
    pathStart(0),
    explorationSampling(explorationSampling)
    {
        if (capacity <= 0)
        {
            throw std::runtime_error("EpisodicBuffer needs a positive capacity, got " + std::to_string(capacity));
        }
        auto options = torch::TensorOptions(device);
        observations = torch::zeros({capacity, observationSize}, options);
        nextObservations = torch::zeros({capacity, observationSize}, options);
        actions = torch::zeros({capacity}, options.dtype(torch::kLong));
        rewards = torch::zeros({capacity, 1}, options);
        dones = torch::zeros({capacity, 1}, options);
        prevActions = torch::zeros({capacity}, options.dtype(torch::kLong));
        prevRewards = torch::zeros({capacity, 1}, options);
        hiddenIn = torch::zeros({capacity, hiddenSize}, options);
        hiddenOut = torch::zeros({capacity, hiddenSize}, options);
    }

    /**
     * @brief Inserts a transition into the storage.
     *
     * @details Copies the provided values into row `ptr` and advances it. Unlike a ring
     * buffer, rows are never overwritten: a full buffer is an error.
     */
    void EpisodicBuffer::store(torch::Tensor observation,
                               torch::Tensor nextObservation,
                               int64_t action,
                               double reward,
                               bool done,
                               int64_t prevAction,
                               double prevReward,
                               torch::Tensor hiddenInState,
                               torch::Tensor hiddenOutState)
    {
        if (ptr >= capacity)
        {
            throw std::runtime_error("EpisodicBuffer is full (" + std::to_string(capacity) +
                                     " transitions); reset() it before storing more");
        }
        torch::NoGradGuard noGrad;
        observations[ptr].copy_(observation.reshape({observationSize}));
        nextObservations[ptr].copy_(nextObservation.reshape({observationSize}));
        actions[ptr].fill_(action);
        rewards[ptr].fill_(reward);
        dones[ptr].fill_(done ? 1. : 0.);
        prevActions[ptr].fill_(prevAction);
        prevRewards[ptr].fill_(prevReward);
        hiddenIn[ptr].copy_(hiddenInState.reshape({hiddenSize}));
        hiddenOut[ptr].copy_(hiddenOutState.reshape({hiddenSize}));

        ++ptr;
    }

    void EpisodicBuffer::finishPath()
    {
        if (ptr == pathStart)
        {
            throw std::runtime_error("finishPath() called without any pending transition");
        }
        episodes.emplace_back(pathStart, ptr);
        sampleCounts.push_back(0);
        pathStart = ptr;
    }

    int64_t EpisodicBuffer::drawEpisode(double pExploration)
    {
        int64_t episode;
        if (explorationSampling && torch::rand({1}).item<double>() < pExploration)
        {
            // min_element returns the first minimum, i.e. the lowest index on ties
            episode = std::distance(sampleCounts.begin(),
                                    std::min_element(sampleCounts.begin(), sampleCounts.end()));
        }
        else
        {
            episode = torch::randint(numEpisodes(), {1}, torch::TensorOptions(torch::kLong)).item<int64_t>();
        }
        ++sampleCounts[episode];
        return episode;
    }

    /**
     * @brief Creates a generator over `batchSize` sampled episodes.
     *
     * @throws std::runtime_error If no episode is available.
     */
    std::unique_ptr<Generator> EpisodicBuffer::episodeGenerator(int64_t batchSize, double pExploration)
    {
        if (episodes.empty())
        {
            throw std::runtime_error("Cannot sample from an EpisodicBuffer without finished episodes");
        }
        std::vector<std::pair<int64_t, int64_t>> selected;
        selected.reserve(batchSize);
        for (int64_t i = 0; i < batchSize; ++i)
        {
            selected.push_back(episodes[drawEpisode(pExploration)]);
        }
        return std::make_unique<EpisodeGenerator>(std::move(selected),
                                                  observations,
                                                  nextObservations,
                                                  actions,
                                                  rewards,
                                                  dones,
                                                  prevActions,
                                                  prevRewards,
                                                  hiddenIn,
                                                  hiddenOut);
    }

    std::vector<EpisodeBatch> EpisodicBuffer::get(int64_t batchSize, double pExploration)
    {
        auto generator = episodeGenerator(batchSize, pExploration);
        std::vector<EpisodeBatch> batch;
        while (!generator->done())
        {
            batch.push_back(generator->next());
        }
        return batch;
    }

    /**
     * @brief Empties the buffer.
     *
     * @details Only the bookkeeping is cleared; rows are overwritten by later stores.
     */
    void EpisodicBuffer::reset()
    {
        ptr = 0;
        pathStart = 0;
        episodes.clear();
        sampleCounts.clear();
    }

    int64_t EpisodicBuffer::sampleCount(int64_t episode) const
    {
        if (episode < 0 || episode >= numEpisodes())
        {
            throw std::runtime_error("Episode index " + std::to_string(episode) + " out of range");
        }
        return sampleCounts[episode];
    }

    namespace
    {
        void storeSteps(EpisodicBuffer &buffer, int steps, int64_t firstAction = 0)
        {
            for (int step = 0; step < steps; ++step)
            {
                buffer.store(torch::rand({3}), torch::rand({3}), firstAction + step, 1.,
                             step == steps - 1, 0, 0., torch::zeros({1, 1, 4}), torch::ones({1, 1, 4}));
            }
        }
    }

    TEST_CASE("EpisodicBuffer")
    {
        EpisodicBuffer buffer(10, 3, 4);

        SUBCASE("Initializes empty")
        {
            CHECK(buffer.size() == 0);
            CHECK(buffer.numEpisodes() == 0);
            CHECK(buffer.getCapacity() == 10);
        }

        SUBCASE("store() past capacity throws")
        {
            storeSteps(buffer, 10);
            CHECK(buffer.size() == 10);
            CHECK_THROWS_AS(storeSteps(buffer, 1), std::runtime_error);
        }

        SUBCASE("finishPath() closes exactly the pending transitions")
        {
            storeSteps(buffer, 3);
            buffer.finishPath();
            storeSteps(buffer, 1);
            buffer.finishPath();

            CHECK(buffer.numEpisodes() == 2);
            CHECK(buffer.pendingSteps() == 0);
            CHECK_THROWS_AS(buffer.finishPath(), std::runtime_error);
        }

        SUBCASE("get() returns whole episodes with their stored fields")
        {
            storeSteps(buffer, 4, 5);
            buffer.finishPath();

            auto batch = buffer.get(2, 0.);
            REQUIRE(batch.size() == 2);
            for (const auto &episode : batch)
            {
                CHECK(episode.length() == 4);
                CHECK(episode.actions[0].item().toLong() == 5);
                CHECK(episode.dones[3].item().toFloat() == doctest::Approx(1));
                CHECK(episode.dones[0].item().toFloat() == doctest::Approx(0));
                CHECK(episode.rewards.sizes().vec() == std::vector<int64_t>{4, 1});
                CHECK(episode.hiddenOut.sizes().vec() == std::vector<int64_t>{4, 4});
            }
            CHECK(buffer.sampleCount(0) == 2);
        }

        SUBCASE("get() on an empty buffer throws")
        {
            CHECK_THROWS_AS(buffer.get(1, 0.), std::runtime_error);
        }

        SUBCASE("reset() drops everything")
        {
            storeSteps(buffer, 5);
            buffer.finishPath();
            buffer.reset();

            CHECK(buffer.size() == 0);
            CHECK(buffer.numEpisodes() == 0);
            storeSteps(buffer, 10);
            CHECK(buffer.size() == 10);
        }
    }

    TEST_CASE("EpisodicBuffer exploration sampling")
    {
        EpisodicBuffer buffer(12, 3, 4, true);
        for (int episode = 0; episode < 3; ++episode)
        {
            storeSteps(buffer, 2, episode * 10);
            buffer.finishPath();
        }

        SUBCASE("Always exploring draws the least sampled episode, lowest index first")
        {
            auto batch = buffer.get(4, 1.);

            REQUIRE(batch.size() == 4);
            CHECK(batch[0].actions[0].item().toLong() == 0);
            CHECK(batch[1].actions[0].item().toLong() == 10);
            CHECK(batch[2].actions[0].item().toLong() == 20);
            CHECK(batch[3].actions[0].item().toLong() == 0);
            CHECK(buffer.sampleCount(0) == 2);
            CHECK(buffer.sampleCount(1) == 1);
            CHECK(buffer.sampleCount(2) == 1);
        }

        SUBCASE("Draw counts add up to the number of sampled episodes")
        {
            buffer.get(16, 0.5);

            CHECK(buffer.sampleCount(0) + buffer.sampleCount(1) + buffer.sampleCount(2) == 16);
        }
    }
}
