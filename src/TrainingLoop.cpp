//
// Created by moinshaikh on 2/13/26.
//

#include<filesystem>
#include<fstream>
#include<string>
#include<utility>
#include<vector>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../include/TrainingLoop.hpp"
#include"../include/Checkpoint.hpp"
#include"../include/Environment/FixedHorizonEnvironment.hpp"

#include<nlohmann/json.hpp>

#include<doctest/doctest.h>

namespace MetaSac
{
    TrainingLoop::TrainingLoop(Environment &environment,
                               ActorCritic &actorCritic,
                               Sac &sac,
                               EpisodicBuffer &buffer,
                               EpochLogger &logger,
                               const SacConfig &config,
                               TrainerState &state) :
    environment(environment),
    actorCritic(actorCritic),
    sac(sac),
    buffer(buffer),
    logger(logger),
    config(config),
    state(state),
    hidden(actorCritic->initialHidden()),
    startTime(std::chrono::steady_clock::now())
    {
        if (config.updateEvery <= 0 || config.saveEveryNUpdate <= 0)
        {
            throw std::runtime_error("updateEvery and saveEveryNUpdate must be positive");
        }
        if (config.maxEpLen <= 0)
        {
            throw std::runtime_error("maxEpLen must be positive");
        }
        if (config.updateEvery > config.numberOfTrajectories)
        {
            throw std::runtime_error("updateEvery exceeds numberOfTrajectories, an epoch would never update");
        }
    }

    void TrainingLoop::run()
    {
        startTime = std::chrono::steady_clock::now();
        while (state.currentEpoch < config.epochs)
        {
            runEpoch();
        }
    }

    void TrainingLoop::runEpoch()
    {
        spdlog::info("Epoch {}/{}", state.currentEpoch + 1, config.epochs);
        hidden = actorCritic->initialHidden();

        for (int64_t trajectory = 0; trajectory < config.numberOfTrajectories; ++trajectory)
        {
            spdlog::info("Trajectory = {}, Total steps = {}", trajectory, state.globalSteps);
            runTrajectory();
            ++state.totalTrajectories;

            if ((trajectory + 1) % config.updateEvery == 0)
            {
                logger.store(sac.update(buffer));
                ++state.updateCounter;
                logTrial(trajectory);
            }
        }

        buffer.reset();
        sac.decayLearningRate();
        ++state.currentEpoch;
    }

    void TrainingLoop::runTrajectory()
    {
        auto observation = environment.reset();
        int64_t prevAction = 0;
        double prevReward = 0;
        double episodeReward = 0;
        int64_t episodeLength = 0;
        bool ended = false;

        while (!ended && episodeLength < config.maxEpLen)
        {
            auto hiddenIn = hidden;
            int64_t action;
            if (state.globalSteps > config.startSteps)
            {
                auto output = config.greedyRollouts
                                  ? actorCritic->act(observation, prevAction, prevReward, hiddenIn)
                                  : actorCritic->explore(observation, prevAction, prevReward, hiddenIn);
                action = output[0].item<int64_t>();
                hidden = output[1];
            }
            else
            {
                // Random warm-up still feeds the memory so the stored snapshots stay consistent
                action = environment.sampleAction();
                hidden = actorCritic->advanceMemory(observation, prevAction, prevReward, hiddenIn);
            }

            auto result = environment.step(action);
            ended = result.terminated || result.truncated;
            episodeReward += result.reward;
            ++episodeLength;
            ++state.globalSteps;

            // Hitting the step limit is not a terminal state of the task
            const bool done = episodeLength == config.maxEpLen ? false : ended;

            buffer.store(observation, result.observation, action, result.reward, done,
                         prevAction, prevReward, hiddenIn, hidden);

            observation = result.observation;
            prevAction = action;
            prevReward = result.reward;
        }

        buffer.finishPath();
        logger.store("EpRew", episodeReward);
        logger.store("EpLen", static_cast<double>(episodeLength));
        spdlog::info("Total reward = {}", episodeReward);
    }

    void TrainingLoop::logTrial(int64_t trajectory)
    {
        const auto saveFrequency = config.saveEveryNUpdate * config.updateEvery;
        if ((trajectory + 1) % saveFrequency == 0 || trajectory + 1 == config.numberOfTrajectories)
        {
            auto &temperature = sac.getTemperature();
            saveCheckpoint(actorCritic,
                           temperature.isLearned() ? temperature.getLogAlpha() : torch::Tensor(),
                           config.outputDirectory,
                           "_" + std::to_string(state.currentEpoch) + "_" + std::to_string(trajectory));
        }

        // Series go out before logStatistics() consumes the values
        const std::vector<std::pair<std::string, std::vector<std::string>>> board = {
            {"Performance", {"EpRew", "EpLen", "Q2Vals", "Q1Vals", "LogPi"}},
            {"Loss", {"LossPi", "LossQ"}},
            {"Entropy", {"Entropy", "Alpha", "LossAlpha"}}
        };
        for (const auto &[group, keys] : board)
        {
            for (const auto &key : keys)
            {
                auto statistics = logger.getStats(key);
                if (group == "Performance")
                {
                    logger.scalar(group + "/Average" + key, statistics.mean, state.globalSteps);
                    logger.scalar(group + "/Std" + key, statistics.std, state.globalSteps);
                }
                else
                {
                    logger.scalar(group + "/" + key, statistics.mean, state.globalSteps);
                }
            }
        }

        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;

        logger.logTabular("Trial", static_cast<double>(trajectory));
        logger.logStatistics("EpRew", true);
        logger.logStatistics("EpLen", false, true);
        logger.logTabular("TotalEnvInteracts", static_cast<double>(state.globalSteps));
        logger.logStatistics("Q2Vals", true);
        logger.logStatistics("Q1Vals", true);
        logger.logStatistics("LogPi", true);
        logger.logStatistics("Entropy", true);
        logger.logStatistics("Alpha", false, true);
        logger.logStatistics("LossAlpha", false, true);
        logger.logStatistics("LossPi", false, true);
        logger.logStatistics("LossQ", false, true);
        logger.logTabular("Time", elapsed.count());
        logger.dumpTabular();
    }

    namespace
    {
        SacConfig loopConfig(const std::string &directory)
        {
            SacConfig config;
            config.hiddenSize = 8;
            config.batchSize = 2;
            config.lr = 1e-3;
            config.maxEpLen = 10;
            config.startSteps = -1;
            config.greedyRollouts = true;
            config.numberOfTrajectories = 100;
            config.updateEvery = 100;
            config.outputDirectory = directory;
            return config;
        }
    }

    TEST_CASE("TrainingLoop")
    {
        torch::manual_seed(0);
        auto directory = std::filesystem::temp_directory_path() / "metasac_training_test";
        std::filesystem::remove_all(directory);

        auto config = loopConfig(directory.string());
        TrainerState state;
        FixedHorizonEnvironment environment(2, 5, 0);
        auto actorCritic = ActorCritic(environment.observationSize(), environment.actionSpace(), config.hiddenSize);

        SUBCASE("A terminating trajectory stores one episode ending with done")
        {
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(50, environment.observationSize(), config.hiddenSize);
            EpochLogger logger(directory.string());
            TrainingLoop loop(environment, actorCritic, sac, buffer, logger, config, state);

            loop.runTrajectory();

            CHECK(buffer.numEpisodes() == 1);
            CHECK(buffer.size() == 5);
            CHECK(state.globalSteps == 5);
            CHECK(logger.getStats("EpLen").mean == doctest::Approx(5));

            auto episode = buffer.get(1, 0)[0];
            auto expected = torch::tensor({0.f, 0.f, 0.f, 0.f, 1.f}).view({5, 1});
            CHECK(torch::equal(episode.dones, expected));
            CHECK(episode.prevActions[0].item<int64_t>() == 0);
            CHECK(episode.prevRewards[0].item<float>() == 0.f);
            CHECK(torch::allclose(episode.hiddenIn.narrow(0, 1, 4), episode.hiddenOut.narrow(0, 0, 4)));
        }

        SUBCASE("Trajectories of an epoch are stored as separate episodes")
        {
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(50, environment.observationSize(), config.hiddenSize);
            EpochLogger logger(directory.string());
            TrainingLoop loop(environment, actorCritic, sac, buffer, logger, config, state);

            loop.runTrajectory();
            loop.runTrajectory();
            loop.runTrajectory();

            CHECK(buffer.numEpisodes() == 3);
            CHECK(buffer.size() == 15);
            CHECK(state.globalSteps == 15);
            CHECK(logger.count("EpRew") == 3);
            for (const auto &episode : buffer.get(3, 0))
            {
                CHECK(episode.length() == 5);
                CHECK(episode.dones[4].item<float>() == 1.f);
            }
        }

        SUBCASE("A one-step episode is stored with a single terminal transition")
        {
            FixedHorizonEnvironment shortEnvironment(2, 1, 0);
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(50, shortEnvironment.observationSize(), config.hiddenSize);
            EpochLogger logger(directory.string());
            TrainingLoop loop(shortEnvironment, actorCritic, sac, buffer, logger, config, state);

            loop.runTrajectory();

            CHECK(buffer.numEpisodes() == 1);
            CHECK(buffer.size() == 1);
            auto episode = buffer.get(1, 0)[0];
            CHECK(episode.length() == 1);
            CHECK(episode.dones[0].item<float>() == 1.f);
            CHECK(logger.getStats("EpLen").mean == doctest::Approx(1));
        }

        SUBCASE("Reaching the step limit stores done = false, even on a terminal step")
        {
            config.maxEpLen = 5;
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(50, environment.observationSize(), config.hiddenSize);
            EpochLogger logger(directory.string());
            TrainingLoop loop(environment, actorCritic, sac, buffer, logger, config, state);

            loop.runTrajectory();

            CHECK(buffer.numEpisodes() == 1);
            CHECK(buffer.size() == 5);
            CHECK(buffer.get(1, 0)[0].dones.sum().item<float>() == 0.f);
        }

        SUBCASE("Random warm-up steps still advance the memory")
        {
            config.startSteps = 100;
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(50, environment.observationSize(), config.hiddenSize);
            EpochLogger logger(directory.string());
            TrainingLoop loop(environment, actorCritic, sac, buffer, logger, config, state);

            loop.runTrajectory();

            auto episode = buffer.get(1, 0)[0];
            CHECK(episode.length() == 5);
            CHECK(!torch::equal(episode.hiddenOut[0], torch::zeros({config.hiddenSize})));
        }

        SUBCASE("An epoch updates, checkpoints, and empties the buffer")
        {
            config.numberOfTrajectories = 4;
            config.updateEvery = 2;
            config.epochsToUpdateLr = 1;
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(config.numberOfTrajectories * config.maxEpLen,
                                  environment.observationSize(), config.hiddenSize);
            {
                EpochLogger logger(directory.string());
                TrainingLoop loop(environment, actorCritic, sac, buffer, logger, config, state);
                loop.run();
            }

            CHECK(buffer.size() == 0);
            CHECK(buffer.numEpisodes() == 0);
            CHECK(state.currentEpoch == 1);
            CHECK(state.totalTrajectories == 4);
            CHECK(state.updateCounter == 2);
            CHECK(state.globalSteps == 20);
            CHECK(sac.getLearningRate() == doctest::Approx(config.lr * config.gammaLr));

            CHECK(std::filesystem::exists(directory / "pyt_save" / "model_0_1.pt"));
            CHECK(std::filesystem::exists(directory / "pyt_save" / "model_0_3.pt"));

            std::ifstream progress(directory / "progress.txt");
            std::string line;
            int lines = 0;
            while (std::getline(progress, line))
            {
                ++lines;
            }
            CHECK(lines == 3);

            std::ifstream metrics(directory / "metrics.jsonl");
            std::vector<nlohmann::json> points;
            while (std::getline(metrics, line))
            {
                points.push_back(nlohmann::json::parse(line));
            }
            // Two updates, each with 5 x 2 performance points and 5 single points
            REQUIRE(points.size() == 30);
            CHECK(points[0]["tag"].get<std::string>() == "Performance/AverageEpRew");
            CHECK(points[0]["step"].get<int64_t>() == 10);
            CHECK(points[1]["tag"].get<std::string>() == "Performance/StdEpRew");
            CHECK(points[10]["tag"].get<std::string>() == "Loss/LossPi");
            CHECK(points[14]["tag"].get<std::string>() == "Entropy/LossAlpha");
            CHECK(points[15]["step"].get<int64_t>() == 20);
        }

        SUBCASE("A non-positive update period is rejected")
        {
            config.updateEvery = 0;
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(50, environment.observationSize(), config.hiddenSize);
            EpochLogger logger(directory.string());
            CHECK_THROWS_AS(TrainingLoop(environment, actorCritic, sac, buffer, logger, config, state),
                            std::runtime_error);
        }

        SUBCASE("A non-positive step limit is rejected")
        {
            config.maxEpLen = 0;
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(50, environment.observationSize(), config.hiddenSize);
            EpochLogger logger(directory.string());
            CHECK_THROWS_AS(TrainingLoop(environment, actorCritic, sac, buffer, logger, config, state),
                            std::runtime_error);
        }

        SUBCASE("An update period longer than the epoch is rejected")
        {
            config.numberOfTrajectories = 3;
            config.updateEvery = 4;
            Sac sac(actorCritic, config);
            EpisodicBuffer buffer(50, environment.observationSize(), config.hiddenSize);
            EpochLogger logger(directory.string());
            CHECK_THROWS_AS(TrainingLoop(environment, actorCritic, sac, buffer, logger, config, state),
                            std::runtime_error);
        }

        std::filesystem::remove_all(directory);
    }
}
