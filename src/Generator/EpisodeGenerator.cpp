//
// Created by moinshaikh on 1/29/26.
//
#include<stdexcept>
#include<vector>

#include<torch/torch.h>

#include"../../include/Generator/EpisodeGenerator.hpp"
#include"../../include/Generator/Generator.hpp"

#include<doctest/doctest.h>


namespace MetaSac
{
    EpisodeGenerator::EpisodeGenerator(
        std::vector<std::pair<int64_t, int64_t>> episodes,
        torch::Tensor observations,
        torch::Tensor nextObservations,
        torch::Tensor actions,
        torch::Tensor rewards,
        torch::Tensor dones,
        torch::Tensor prevActions,
        torch::Tensor prevRewards,
        torch::Tensor hiddenIn,
        torch::Tensor hiddenOut) :
    observations(observations),
    nextObservations(nextObservations),
    actions(actions),
    rewards(rewards),
    dones(dones),
    prevActions(prevActions),
    prevRewards(prevRewards),
    hiddenIn(hiddenIn),
    hiddenOut(hiddenOut),
    episodes(std::move(episodes)),
    index(0)
    {
    }

    bool EpisodeGenerator::done() const
    {
        return index >= episodes.size();
    }

    /**
     * @details Every field is the `narrow` of the corresponding buffer tensor over
     * `[begin, end)`, so the rows keep their time order.
     */
    EpisodeBatch EpisodeGenerator::next()
    {
        if (done())
        {
            throw std::runtime_error("No episodes left in generator");
        }
        const auto begin = episodes[index].first;
        const auto length = episodes[index].second - begin;
        ++index;

        return EpisodeBatch(observations.narrow(0, begin, length),
                            nextObservations.narrow(0, begin, length),
                            actions.narrow(0, begin, length),
                            rewards.narrow(0, begin, length),
                            dones.narrow(0, begin, length),
                            prevActions.narrow(0, begin, length),
                            prevRewards.narrow(0, begin, length),
                            hiddenIn.narrow(0, begin, length),
                            hiddenOut.narrow(0, begin, length));
    }

    TEST_CASE("EpisodeGenerator")
    {
        auto observations = torch::arange(0, 10).to(torch::kFloat).view({10, 1});
        auto actions = torch::arange(0, 10).to(torch::kLong);
        auto column = torch::zeros({10, 1});
        auto hidden = torch::zeros({10, 4});
        EpisodeGenerator generator({{0, 3}, {3, 10}, {0, 3}},
                                   observations, observations, actions, column, column,
                                   actions, column, hidden, hidden);

        SUBCASE("Emits each selected episode in order")
        {
            auto first = generator.next();
            CHECK(first.length() == 3);
            CHECK(first.actions[0].item().toLong() == 0);

            auto second = generator.next();
            CHECK(second.length() == 7);
            CHECK(second.observations[0].item().toFloat() == doctest::Approx(3));
            CHECK(second.hiddenIn.sizes().vec() == std::vector<int64_t>{7, 4});

            auto third = generator.next();
            CHECK(third.length() == 3);
            CHECK(generator.done());
        }

        SUBCASE("Throws when exhausted")
        {
            while (!generator.done())
            {
                generator.next();
            }
            CHECK_THROWS_AS(generator.next(), std::runtime_error);
        }

        SUBCASE("An episode can be copied to the device of the network")
        {
            auto episode = generator.next().to(torch::kCPU);
            CHECK(episode.length() == 3);
            CHECK(episode.hiddenOut.device() == torch::Device(torch::kCPU));

            if (torch::cuda::is_available())
            {
                auto moved = generator.next().to(torch::kCUDA);
                CHECK(moved.observations.is_cuda());
                CHECK(moved.prevRewards.is_cuda());
                CHECK(moved.length() == 7);
            }
        }
    }
}
