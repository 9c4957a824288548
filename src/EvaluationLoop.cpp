//
// Created by moinshaikh on 2/13/26.
//

#include<filesystem>
#include<fstream>
#include<string>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../include/EvaluationLoop.hpp"
#include"../include/Checkpoint.hpp"
#include"../include/Environment/FixedHorizonEnvironment.hpp"

#include<doctest/doctest.h>
#include<nlohmann/json.hpp>

namespace MetaSac
{
    EvaluationLoop::EvaluationLoop(Environment &environment,
                                   ActorCritic &actorCritic,
                                   EpochLogger &logger,
                                   const SacConfig &config,
                                   TrainerState &state) :
    environment(environment),
    actorCritic(actorCritic),
    logger(logger),
    config(config),
    state(state)
    {
        if (config.greedyRatio < 0 || config.greedyRatio > 1)
        {
            throw std::runtime_error("greedyRatio must lie in [0, 1]");
        }
    }

    torch::Tensor EvaluationLoop::warmUp(torch::Tensor observation)
    {
        for (int64_t step = 0; step < config.randomInit; ++step)
        {
            auto result = environment.step(environment.sampleAction());
            observation = result.observation;
            if (result.terminated || result.truncated)
            {
                observation = environment.reset();
            }
        }
        return observation;
    }

    EvaluationTrace EvaluationLoop::run()
    {
        EvaluationTrace trace;

        for (int64_t episode = 0; episode < config.numTestEpisodes; ++episode)
        {
            auto observation = warmUp(environment.reset());
            auto hidden = actorCritic->initialHidden();
            int64_t prevAction = 0;
            double prevReward = 0;
            double episodeReward = 0;
            int64_t episodeLength = 0;
            bool ended = false;

            trace.observations.emplace_back();
            trace.rewards.emplace_back();

            while (!ended && episodeLength < config.maxEpLen)
            {
                const bool greedy = torch::rand({1}).item<double>() <= config.greedyRatio;
                auto output = greedy
                                  ? actorCritic->act(observation, prevAction, prevReward, hidden)
                                  : actorCritic->explore(observation, prevAction, prevReward, hidden);
                const auto action = output[0].item<int64_t>();
                hidden = output[1];

                auto result = environment.step(action);
                ended = result.terminated || result.truncated;

                observation = result.observation;
                prevAction = action;
                prevReward = result.reward;

                trace.observations.back().push_back(result.observation);
                trace.rewards.back().push_back(result.reward);
                episodeReward += result.reward;
                ++episodeLength;
                ++state.globalTestSteps;
            }

            logger.store("TestEpRew", episodeReward);
            logger.store("TestEpLen", static_cast<double>(episodeLength));
            spdlog::info("Test episode {}: reward = {}, length = {}", episode, episodeReward, episodeLength);
        }

        if (config.numTestEpisodes > 0)
        {
            auto rewardStats = logger.takeStats("TestEpRew");
            auto lengthStats = logger.takeStats("TestEpLen");
            spdlog::info("AverageTestEpRew: {:.4f}, StdTestEpRew: {:.4f}, MaxTestEpRew: {:.4f}, MinTestEpRew: {:.4f}",
                         rewardStats.mean, rewardStats.std, rewardStats.max, rewardStats.min);
            spdlog::info("AverageTestEpLen: {:.1f}, TotalTestInteracts: {}", lengthStats.mean, state.globalTestSteps);

            logger.scalar("Performance/AverageTestEpRew", rewardStats.mean, state.globalTestSteps);
            logger.scalar("Performance/StdTestEpRew", rewardStats.std, state.globalTestSteps);
            logger.scalar("Performance/AverageTestEpLen", lengthStats.mean, state.globalTestSteps);
            logger.scalar("Performance/StdTestEpLen", lengthStats.std, state.globalTestSteps);
        }
        ++state.currentTestEpoch;

        // The evaluated weights become the latest untagged checkpoint
        saveCheckpoint(actorCritic, torch::Tensor(), config.outputDirectory, "");

        return trace;
    }

    TEST_CASE("EvaluationLoop")
    {
        torch::manual_seed(0);
        auto directory = std::filesystem::temp_directory_path() / "metasac_evaluation_test";
        std::filesystem::remove_all(directory);

        SacConfig config;
        config.hiddenSize = 8;
        config.maxEpLen = 10;
        config.numTestEpisodes = 3;
        config.randomInit = 0;
        config.outputDirectory = directory.string();
        TrainerState state;
        FixedHorizonEnvironment environment(3, 4, 1);
        auto actorCritic = ActorCritic(environment.observationSize(), environment.actionSpace(), config.hiddenSize);
        EpochLogger logger(directory.string());

        SUBCASE("Returns one trace per trajectory")
        {
            EvaluationLoop loop(environment, actorCritic, logger, config, state);
            auto trace = loop.run();

            REQUIRE(trace.observations.size() == 3);
            REQUIRE(trace.rewards.size() == 3);
            for (size_t i = 0; i < 3; ++i)
            {
                CHECK(trace.observations[i].size() == 4);
                CHECK(trace.rewards[i].size() == 4);
            }
            CHECK(state.globalTestSteps == 12);
            CHECK(state.currentTestEpoch == 1);
            CHECK(logger.count("TestEpRew") == 0);
        }

        SUBCASE("Test statistics are written as series and the model is saved")
        {
            EvaluationLoop loop(environment, actorCritic, logger, config, state);
            loop.run();

            CHECK(std::filesystem::exists(directory / "pyt_save" / "model.pt"));

            std::ifstream metrics(directory / "metrics.jsonl");
            std::vector<std::string> tags;
            std::string line;
            while (std::getline(metrics, line))
            {
                auto point = nlohmann::json::parse(line);
                CHECK(point["step"].get<int64_t>() == 12);
                tags.push_back(point["tag"].get<std::string>());
            }
            CHECK(tags == std::vector<std::string>{"Performance/AverageTestEpRew", "Performance/StdTestEpRew",
                                                   "Performance/AverageTestEpLen", "Performance/StdTestEpLen"});
        }

        SUBCASE("Trajectories are cut at the step limit")
        {
            config.maxEpLen = 2;
            EvaluationLoop loop(environment, actorCritic, logger, config, state);
            auto trace = loop.run();

            CHECK(trace.rewards[0].size() == 2);
            CHECK(state.globalTestSteps == 6);
        }

        SUBCASE("A purely greedy evaluation is deterministic")
        {
            config.greedyRatio = 1.0;
            EvaluationLoop loop(environment, actorCritic, logger, config, state);
            auto trace = loop.run();

            CHECK(trace.rewards[0] == trace.rewards[1]);
            CHECK(trace.rewards[1] == trace.rewards[2]);
        }

        SUBCASE("Random warm-up steps are not part of the trace")
        {
            config.randomInit = 6;
            EvaluationLoop loop(environment, actorCritic, logger, config, state);
            auto trace = loop.run();

            CHECK(state.globalTestSteps == static_cast<int64_t>(trace.rewards[0].size() +
                                                                trace.rewards[1].size() +
                                                                trace.rewards[2].size()));
        }

        SUBCASE("An out of range greedy ratio is rejected")
        {
            config.greedyRatio = 1.5;
            CHECK_THROWS_AS(EvaluationLoop(environment, actorCritic, logger, config, state), std::runtime_error);
        }

        std::filesystem::remove_all(directory);
    }
}
