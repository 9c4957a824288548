/**
 * @file Sac.cpp
 * @brief Discrete soft actor-critic update over recurrent episodes
 * @author moinshaikh
 * @date 2/10/26
 *
 * Each sampled episode is replayed as one GRU sequence from its first stored hidden
 * snapshot. Critic and policy are optimized by separate Adam instances; the target
 * network is moved once per update by polyak averaging.
 */

#include<cmath>
#include<filesystem>
#include<stdexcept>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Algorithms/Sac.hpp"
#include"../../include/Algorithms/ParameterPhase.hpp"
#include"../../include/Algorithms/SacLoss.hpp"
#include"../../include/Checkpoint.hpp"
#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    Sac::Sac(ActorCritic &actorCritic, const SacConfig &config) :
    actorCritic(actorCritic),
    target(actorCritic->getQ1().getNumInputs(), actorCritic->getActionSpace(), actorCritic->getHiddenSize()),
    config(config),
    temperature(config.useAlphaAnnealing,
                config.fixedAlpha,
                actorCritic->getNumActions(),
                config.entropyTargetMult,
                config.lr,
                actorCritic->getDevice()),
    scheduleSteps(0)
    {
        if (config.epochsToUpdateLr <= 0)
        {
            throw std::runtime_error("epochsToUpdateLr must be positive");
        }
        if (config.polyak < 0 || config.polyak > 1)
        {
            throw std::runtime_error("polyak must lie in [0, 1]");
        }

        if (!config.modelFileToLoad.empty())
        {
            loadCheckpoint(config.modelFileToLoad, actorCritic);
            if (temperature.isLearned())
            {
                auto logAlphaPath = logAlphaCheckpointPath(config.modelFileToLoad);
                if (std::filesystem::exists(logAlphaPath))
                {
                    temperature.setLogAlpha(loadLogAlpha(logAlphaPath));
                    spdlog::info("Resumed entropy temperature alpha = {}", temperature.alpha());
                }
                else
                {
                    spdlog::warn("No {} next to the model, alpha restarts at 1", logAlphaPath);
                }
            }
        }

        // Freeze target network; it only changes through polyakUpdate
        target->to(actorCritic->getDevice());
        hardUpdate(actorCritic->parameters(), target->parameters());
        for (auto &parameter : target->parameters())
        {
            parameter.requires_grad_(false);
        }

        criticOptimizer = std::make_unique<torch::optim::Adam>(actorCritic->criticParameters(),
                                                               torch::optim::AdamOptions(config.lr));
        policyOptimizer = std::make_unique<torch::optim::Adam>(actorCritic->policyParameters(),
                                                               torch::optim::AdamOptions(config.lr));

        auto counts = actorCritic->parameterCounts();
        spdlog::info("Number of parameters: pi: {}, q1: {}, q2: {}, memory: {}",
                     counts[0].second, counts[1].second, counts[2].second, counts[3].second);
    }

    /**
     * @brief One SAC optimization cycle.
     *
     * The per-episode order is critic step, policy step, temperature step. The temperature
     * step uses the log-probabilities of the policy step that just ran. A shape mismatch
     * inside a loss propagates out of update(); the phase scopes restore the gradient
     * flags and no target update happens for that cycle.
     */
    std::vector<UpdateDatum> Sac::update(EpisodicBuffer &buffer)
    {
        auto generator = buffer.episodeGenerator(config.batchSize, config.pExploration);

        std::vector<UpdateDatum> data;
        torch::Tensor alphaLoss = torch::scalar_tensor(0.);
        while (!generator->done())
        {
            // Stored on the CPU; replayed where the weights live
            auto episode = generator->next().to(actorCritic->getDevice());
            const auto alpha = temperature.alpha();

            {
                ParameterPhaseScope scope(ComputationPhase::Critic, *actorCritic);
                auto critic = computeCriticLoss(actorCritic, target, episode, config.gamma, alpha);

                criticOptimizer->zero_grad();
                critic[0].backward();
                torch::nn::utils::clip_grad_norm_(actorCritic->criticParameters(), config.clipRatio);
                criticOptimizer->step();

                data.push_back({"LossQ", critic[0].detach()});
                data.push_back({"Q1Vals", critic[1]});
                data.push_back({"Q2Vals", critic[2]});
            }

            torch::Tensor logProbabilities;
            {
                ParameterPhaseScope scope(ComputationPhase::Policy, *actorCritic);
                policyOptimizer->zero_grad();
                auto policy = computePolicyLoss(actorCritic, episode, alpha);

                policy[0].backward();
                torch::nn::utils::clip_grad_norm_(actorCritic->policyParameters(), config.clipRatio);
                policyOptimizer->step();

                logProbabilities = policy[1].detach();
                data.push_back({"LossPi", policy[0].detach()});
                data.push_back({"LogPi", logProbabilities});
                data.push_back({"Entropy", policy[2]});
            }

            {
                ParameterPhaseScope scope(ComputationPhase::Temperature, *actorCritic);
                alphaLoss = temperature.update(logProbabilities);
            }
        }

        data.push_back({"Alpha", torch::scalar_tensor(temperature.alpha())});
        data.push_back({"LossAlpha", alphaLoss});

        polyakUpdate(actorCritic->parameters(), target->parameters(), config.polyak);

        return data;
    }

    void Sac::decayLearningRate()
    {
        ++scheduleSteps;
        const auto learningRate = config.lr * std::pow(config.gammaLr, scheduleSteps / config.epochsToUpdateLr);
        for (auto &group : criticOptimizer->param_groups())
        {
            static_cast<torch::optim::AdamOptions &>(group.options()).lr(learningRate);
        }
        for (auto &group : policyOptimizer->param_groups())
        {
            static_cast<torch::optim::AdamOptions &>(group.options()).lr(learningRate);
        }
    }

    double Sac::getLearningRate() const
    {
        return static_cast<const torch::optim::AdamOptions &>(policyOptimizer->param_groups()[0].options()).lr();
    }

    namespace
    {
        void fillBuffer(EpisodicBuffer &buffer, int episodes, int length)
        {
            for (int episode = 0; episode < episodes; ++episode)
            {
                for (int step = 0; step < length; ++step)
                {
                    buffer.store(torch::rand({3}), torch::rand({3}), step % 2, step % 2 ? 1. : 0.,
                                 step == length - 1, (step + 1) % 2, step % 2 ? 0. : 1.,
                                 torch::rand({1, 1, 8}), torch::rand({1, 1, 8}));
                }
                buffer.finishPath();
            }
        }

        SacConfig testConfig()
        {
            SacConfig config;
            config.batchSize = 3;
            config.hiddenSize = 8;
            config.lr = 1e-3;
            config.polyak = 0.9;
            return config;
        }
    }

    TEST_CASE("Sac")
    {
        torch::manual_seed(0);
        auto config = testConfig();
        ActionSpace space{"Discrete", {2}};
        auto actorCritic = ActorCritic(3, space, config.hiddenSize);
        EpisodicBuffer buffer(40, 3, config.hiddenSize);
        fillBuffer(buffer, 4, 5);

        SUBCASE("Target starts as a non-aliased copy that never records gradients")
        {
            Sac sac(actorCritic, config);
            auto online = actorCritic->parameters();
            auto target = sac.getTarget()->parameters();

            REQUIRE(online.size() == target.size());
            for (size_t i = 0; i < online.size(); ++i)
            {
                CHECK(torch::equal(online[i], target[i]));
                CHECK(online[i].data_ptr() != target[i].data_ptr());
                CHECK(!target[i].requires_grad());
            }
        }

        SUBCASE("update() reports every metric")
        {
            Sac sac(actorCritic, config);
            auto data = sac.update(buffer);

            CHECK(data.size() == static_cast<size_t>(config.batchSize * 6 + 2));
            CHECK(data[0].name == "LossQ");
            CHECK(data[3].name == "LossPi");
            CHECK(data[data.size() - 2].name == "Alpha");
            CHECK(data[data.size() - 2].value.item<double>() == doctest::Approx(0.2));
            CHECK(data.back().name == "LossAlpha");
            CHECK(data.back().value.item<double>() == doctest::Approx(0));
        }

        SUBCASE("Per-step metrics keep every element of the episode")
        {
            Sac sac(actorCritic, config);
            auto data = sac.update(buffer);

            CHECK(data[0].value.dim() == 0);
            CHECK(data[1].name == "Q1Vals");
            CHECK(data[1].value.sizes().vec() == std::vector<int64_t>{5, 1});
            CHECK(data[4].name == "LogPi");
            CHECK(data[4].value.sizes().vec() == std::vector<int64_t>{5, 2});
            CHECK(data[5].name == "Entropy");
            CHECK(data[5].value.sizes().vec() == std::vector<int64_t>{5, 1});
            for (const auto &datum : data)
            {
                CHECK(!datum.value.requires_grad());
            }
        }

        SUBCASE("Critic loss on terminal zero-reward steps is the mean squared Q-value")
        {
            EpisodicBuffer terminal(10, 3, config.hiddenSize);
            for (int episode = 0; episode < 2; ++episode)
            {
                for (int step = 0; step < 3; ++step)
                {
                    terminal.store(torch::rand({3}), torch::rand({3}), step % 2, 0., true, 0, 0.,
                                   torch::zeros({1, 1, 8}), torch::zeros({1, 1, 8}));
                }
                terminal.finishPath();
            }
            {
                torch::NoGradGuard noGrad;
                auto q1 = actorCritic->getQ1().named_parameters();
                auto q2 = actorCritic->getQ2().named_parameters();
                q1["qLinear.weight"].zero_();
                q1["qLinear.bias"].fill_(1.5);
                q2["qLinear.weight"].zero_();
                q2["qLinear.bias"].fill_(-0.5);
            }
            config.batchSize = 1;
            Sac sac(actorCritic, config);
            auto data = sac.update(terminal);

            REQUIRE(data[0].name == "LossQ");
            CHECK(data[0].value.item<double>() == doctest::Approx(1.5 * 1.5 + 0.5 * 0.5));
            CHECK(data[1].value.mean().item<double>() == doctest::Approx(1.5));
            CHECK(data[2].value.mean().item<double>() == doctest::Approx(-0.5));
        }

        SUBCASE("Target follows the polyak formula after an update")
        {
            Sac sac(actorCritic, config);
            std::vector<torch::Tensor> before;
            for (const auto &parameter : sac.getTarget()->parameters())
            {
                before.push_back(parameter.clone());
            }

            sac.update(buffer);

            auto online = actorCritic->parameters();
            auto target = sac.getTarget()->parameters();
            bool moved = false;
            for (size_t i = 0; i < online.size(); ++i)
            {
                auto expected = config.polyak * before[i] + (1 - config.polyak) * online[i].detach();
                CHECK(torch::allclose(target[i], expected, 1e-5, 1e-6));
                CHECK(!target[i].grad().defined());
                moved = moved || !torch::equal(target[i], before[i]);
            }
            CHECK(moved);
        }

        SUBCASE("Gradient flags are restored after an update")
        {
            Sac sac(actorCritic, config);
            sac.update(buffer);

            for (const auto &parameter : actorCritic->parameters())
            {
                CHECK(parameter.requires_grad());
            }
        }

        SUBCASE("Learned temperature stays positive and moves")
        {
            config.useAlphaAnnealing = true;
            Sac sac(actorCritic, config);
            auto data = sac.update(buffer);

            CHECK(data[data.size() - 2].value.item<double>() > 0);
            CHECK(data[data.size() - 2].value.item<double>() != doctest::Approx(1));
            CHECK(sac.getTemperature().getLogAlpha().defined());
        }

        SUBCASE("Learning rate decays every epochsToUpdateLr epochs")
        {
            config.gammaLr = 0.5;
            config.epochsToUpdateLr = 2;
            Sac sac(actorCritic, config);

            CHECK(sac.getLearningRate() == doctest::Approx(1e-3));
            sac.decayLearningRate();
            CHECK(sac.getLearningRate() == doctest::Approx(1e-3));
            sac.decayLearningRate();
            CHECK(sac.getLearningRate() == doctest::Approx(5e-4));
            sac.decayLearningRate();
            sac.decayLearningRate();
            CHECK(sac.getLearningRate() == doctest::Approx(2.5e-4));
        }

        SUBCASE("Resuming restores the model and the learned temperature")
        {
            auto directory = (std::filesystem::temp_directory_path() / "metasac_sac_resume_test").string();
            std::filesystem::remove_all(directory);
            auto modelPath = saveCheckpoint(actorCritic, torch::full({1}, 0.7), directory, "_0_0");

            config.useAlphaAnnealing = true;
            config.modelFileToLoad = modelPath;
            auto resumed = ActorCritic(3, space, config.hiddenSize);
            Sac sac(resumed, config);

            CHECK(sac.getTemperature().alpha() == doctest::Approx(std::exp(0.7)));
            CHECK(sac.getTemperature().getLogAlpha().requires_grad());
            auto saved = actorCritic->parameters();
            auto loaded = resumed->parameters();
            REQUIRE(saved.size() == loaded.size());
            for (size_t i = 0; i < saved.size(); ++i)
            {
                CHECK(torch::equal(saved[i], loaded[i]));
            }
        }

        SUBCASE("Resuming without a log_alpha file starts the temperature afresh")
        {
            auto directory = (std::filesystem::temp_directory_path() / "metasac_sac_resume_test").string();
            std::filesystem::remove_all(directory);
            config.useAlphaAnnealing = true;
            config.modelFileToLoad = saveCheckpoint(actorCritic, torch::Tensor(), directory, "_0_0");
            Sac sac(actorCritic, config);

            CHECK(sac.getTemperature().alpha() == doctest::Approx(1));
        }

        SUBCASE("Target and temperature live on the device of the online network")
        {
            if (torch::cuda::is_available())
            {
                actorCritic->to(torch::kCUDA);
            }
            config.useAlphaAnnealing = true;
            Sac sac(actorCritic, config);

            for (const auto &parameter : sac.getTarget()->parameters())
            {
                CHECK(parameter.device() == actorCritic->getDevice());
            }
            CHECK(sac.getTemperature().getLogAlpha().device() == actorCritic->getDevice());

            auto data = sac.update(buffer);
            CHECK(data.back().name == "LossAlpha");
            for (const auto &parameter : sac.getTarget()->parameters())
            {
                CHECK(parameter.device() == actorCritic->getDevice());
            }
        }

        SUBCASE("Missing model file is an error")
        {
            config.modelFileToLoad = "does/not/exist.pt";

            CHECK_THROWS_AS(Sac(actorCritic, config), std::runtime_error);
        }

        SUBCASE("Updating from an empty buffer is an error")
        {
            Sac sac(actorCritic, config);
            buffer.reset();

            CHECK_THROWS_AS(sac.update(buffer), std::runtime_error);
        }
    }
}
