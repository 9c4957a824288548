//
// Created by moinshaikh on 2/9/26.
//

#include<sstream>
#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Algorithms/SacLoss.hpp"
#include"../../include/Generator/Generator.hpp"
#include"../../include/Model/ActorCritic.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    namespace
    {
        void checkSameShape(const torch::Tensor &left, const torch::Tensor &right, const char *what)
        {
            if (left.sizes() != right.sizes())
            {
                std::ostringstream message;
                message << "Shape mismatch in critic backup: " << what << " " << left.sizes()
                        << " vs next value " << right.sizes();
                throw std::runtime_error(message.str());
            }
        }
    }

    std::vector<torch::Tensor> computeCriticLoss(ActorCritic &actorCritic,
        ActorCritic &target,
        const EpisodeBatch &episode,
        double gamma,
        double alpha)
    {
        auto actions = episode.actions.to(torch::kLong).unsqueeze(-1);
        auto q1 = actorCritic->getQ1().forward(episode.observations).gather(-1, actions);
        auto q2 = actorCritic->getQ2().forward(episode.observations).gather(-1, actions);

        torch::Tensor backup;
        {
            torch::NoGradGuard noGrad;
            auto hidden = episode.hiddenOut[0].view({1, 1, actorCritic->getHiddenSize()});
            auto embedding = actorCritic->getMemory().forward(episode.nextObservations,
                                                              episode.actions,
                                                              episode.rewards,
                                                              hidden)[0];
            auto sampled = actorCritic->getPolicy().sample(embedding);
            auto nextProbabilities = sampled[1];
            auto nextLogProbabilities = sampled[2];

            auto qTarget = torch::min(target->getQ1().forward(episode.nextObservations),
                                      target->getQ2().forward(episode.nextObservations));
            auto nextValue = (nextProbabilities * (qTarget - alpha * nextLogProbabilities)).sum(-1, true);

            checkSameShape(episode.rewards, nextValue, "reward");
            checkSameShape(episode.dones, nextValue, "done");
            backup = episode.rewards + gamma * (1 - episode.dones) * nextValue;
        }

        auto lossQ1 = (q1 - backup).pow(2).mean();
        auto lossQ2 = (q2 - backup).pow(2).mean();

        return {lossQ1 + lossQ2, q1.detach(), q2.detach()};
    }

    std::vector<torch::Tensor> computePolicyLoss(ActorCritic &actorCritic,
        const EpisodeBatch &episode,
        double alpha)
    {
        auto hidden = episode.hiddenIn[0].view({1, 1, actorCritic->getHiddenSize()});
        auto embedding = actorCritic->getMemory().forward(episode.observations,
                                                          episode.prevActions,
                                                          episode.prevRewards,
                                                          hidden)[0];
        auto sampled = actorCritic->getPolicy().sample(embedding);
        auto probabilities = sampled[1];
        auto logProbabilities = sampled[2];
        auto entropy = sampled[3];

        torch::Tensor qMin;
        {
            torch::NoGradGuard noGrad;
            qMin = torch::min(actorCritic->getQ1().forward(episode.observations),
                              actorCritic->getQ2().forward(episode.observations));
        }
        auto qExpected = (probabilities * qMin).sum(-1, true);
        auto loss = (-qExpected - alpha * entropy).mean();

        return {loss, logProbabilities, entropy.detach()};
    }

    namespace
    {
        EpisodeBatch makeEpisode(int64_t length, int64_t observationSize, int64_t numActions, int64_t hiddenSize)
        {
            return EpisodeBatch(torch::rand({length, observationSize}),
                                torch::rand({length, observationSize}),
                                torch::randint(0, numActions, {length}, torch::kLong),
                                torch::rand({length, 1}),
                                torch::zeros({length, 1}),
                                torch::randint(0, numActions, {length}, torch::kLong),
                                torch::rand({length, 1}),
                                torch::zeros({length, hiddenSize}),
                                torch::zeros({length, hiddenSize}));
        }

        void setConstantQ(QNetwork &network, double value)
        {
            torch::NoGradGuard noGrad;
            auto parameters = network.named_parameters();
            parameters["qLinear.weight"].zero_();
            parameters["qLinear.bias"].fill_(value);
        }
    }

    TEST_CASE("computeCriticLoss()")
    {
        ActionSpace space{"Discrete", {3}};
        auto actorCritic = ActorCritic(4, space, 8);
        auto target = ActorCritic(4, space, 8);
        auto episode = makeEpisode(6, 4, 3, 8);

        SUBCASE("Returns a scalar loss and per-step Q-values")
        {
            auto outputs = computeCriticLoss(actorCritic, target, episode, 0.99, 0.2);

            REQUIRE(outputs.size() == 3);
            CHECK(outputs[0].dim() == 0);
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{6, 1});
            CHECK(outputs[2].sizes().vec() == std::vector<int64_t>{6, 1});
        }

        SUBCASE("Terminal zero-reward steps back up to zero")
        {
            episode.rewards = torch::zeros({6, 1});
            episode.dones = torch::ones({6, 1});

            auto outputs = computeCriticLoss(actorCritic, target, episode, 0.99, 0.2);
            auto expected = outputs[1].pow(2).mean() + outputs[2].pow(2).mean();

            CHECK(outputs[0].item().toDouble() == doctest::Approx(expected.item().toDouble()).epsilon(1e-5));
        }

        SUBCASE("Bootstrap uses the soft value of the target networks")
        {
            setConstantQ(target->getQ1(), 2.);
            setConstantQ(target->getQ2(), 5.);
            setConstantQ(actorCritic->getQ1(), 0.);
            setConstantQ(actorCritic->getQ2(), 0.);
            episode.rewards = torch::ones({6, 1});

            // alpha = 0: next_v = min target = 2, backup = 1 + 0.5 * 2
            auto outputs = computeCriticLoss(actorCritic, target, episode, 0.5, 0.);

            CHECK(outputs[0].item().toDouble() == doctest::Approx(2 * 4.).epsilon(1e-5));
        }

        SUBCASE("Gradients reach the critic only")
        {
            auto outputs = computeCriticLoss(actorCritic, target, episode, 0.99, 0.2);
            outputs[0].backward();

            for (const auto &parameter : actorCritic->criticParameters())
            {
                CHECK(parameter.grad().defined());
            }
            for (const auto &parameter : actorCritic->policyParameters())
            {
                CHECK(!parameter.grad().defined());
            }
            for (const auto &parameter : target->parameters())
            {
                CHECK(!parameter.grad().defined());
            }
        }

        SUBCASE("Mismatched reward shape is an invariant violation")
        {
            episode.rewards = torch::rand({6});

            CHECK_THROWS_AS(computeCriticLoss(actorCritic, target, episode, 0.99, 0.2), std::runtime_error);
        }
    }

    TEST_CASE("computePolicyLoss()")
    {
        ActionSpace space{"Discrete", {3}};
        auto actorCritic = ActorCritic(4, space, 8);
        auto episode = makeEpisode(5, 4, 3, 8);

        SUBCASE("Returns loss, log-probabilities of every action and entropy")
        {
            auto outputs = computePolicyLoss(actorCritic, episode, 0.2);

            REQUIRE(outputs.size() == 3);
            CHECK(outputs[0].dim() == 0);
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{5, 3});
            CHECK(outputs[2].sizes().vec() == std::vector<int64_t>{5, 1});
            CHECK((outputs[2] >= 0).all().item().toBool());
        }

        SUBCASE("Constant Q-values without entropy bonus give a loss of minus that value")
        {
            setConstantQ(actorCritic->getQ1(), 3.);
            setConstantQ(actorCritic->getQ2(), 4.);

            auto outputs = computePolicyLoss(actorCritic, episode, 0.);

            CHECK(outputs[0].item().toDouble() == doctest::Approx(-3.).epsilon(1e-5));
        }

        SUBCASE("Entropy bonus lowers the loss")
        {
            auto withoutBonus = computePolicyLoss(actorCritic, episode, 0.)[0].item().toDouble();
            auto withBonus = computePolicyLoss(actorCritic, episode, 1.)[0].item().toDouble();

            CHECK(withBonus < withoutBonus);
        }

        SUBCASE("Gradients reach the policy head and the memory encoder, not the critic")
        {
            auto outputs = computePolicyLoss(actorCritic, episode, 0.2);
            outputs[0].backward();

            for (const auto &parameter : actorCritic->getPolicy().parameters())
            {
                CHECK(parameter.grad().defined());
            }
            for (const auto &parameter : actorCritic->getMemory().parameters())
            {
                CHECK(parameter.grad().defined());
            }
            for (const auto &parameter : actorCritic->criticParameters())
            {
                CHECK(!parameter.grad().defined());
            }
        }
    }
}
