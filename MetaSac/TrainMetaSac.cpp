//
// Created by moinshaikh on 2/14/26.
//

#include<memory>
#include<string>

#include<spdlog/spdlog.h>
#include<ATen/Parallel.h>
#include<torch/torch.h>

#include"../include/MetaSac.hpp"

#include"Communication.hpp"
#include"GymEnvironment.hpp"

using namespace MetaSac;

// Environment
const std::string envName = "Bandit";     // "Bandit" runs the built-in task, anything else is created on the gym server
const std::string gymServerUrl = "tcp://127.0.0.1:10201";
const int banditArms = 5;
const int banditPulls = 10;

// Algorithm hyperparameters
const int seed = 42;
const int maxEpLen = 10;
const int numberOfTrajectories = 100;
const int epochs = 20;
const int updateEvery = 10;
const int saveEveryNUpdate = 5;
const int batchSize = 16;
const int startSteps = 1000;
const float discountFactor = 0.99;
const float learningRate = 3e-4;
const float gammaLr = 0.5;
const int epochsToUpdateLr = 10;
const float polyak = 0.995;
const float clipRatio = 1.0;
const bool useAlphaAnnealing = true;
const float entropyTargetMult = 0.5;
const float fixedAlpha = 0.2;
const bool explorationSampling = true;
const float pExploration = 0.1;

// Evaluation
const int numTestEpisodes = 10;
const int randomInit = 0;
const float greedyRatio = 0.8;

// Model hyperparameters
const int hiddenSize = 64;
const bool useCuda = false;
const std::string modelFileToLoad = "";
const std::string outputDirectory = "runs/meta_sac";

int main(int argc, char *argv[])
{
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("%^[%T %7l] %v%$");
    at::set_num_threads(1);
    torch::manual_seed(seed);

    torch::Device device = useCuda ? torch::kCUDA : torch::kCPU;

    SacConfig config;
    config.seed = seed;
    config.maxEpLen = maxEpLen;
    config.numberOfTrajectories = numberOfTrajectories;
    config.epochs = epochs;
    config.updateEvery = updateEvery;
    config.saveEveryNUpdate = saveEveryNUpdate;
    config.batchSize = batchSize;
    config.startSteps = startSteps;
    config.gamma = discountFactor;
    config.lr = learningRate;
    config.gammaLr = gammaLr;
    config.epochsToUpdateLr = epochsToUpdateLr;
    config.polyak = polyak;
    config.clipRatio = clipRatio;
    config.useAlphaAnnealing = useAlphaAnnealing;
    config.entropyTargetMult = entropyTargetMult;
    config.fixedAlpha = fixedAlpha;
    config.explorationSampling = explorationSampling;
    config.pExploration = pExploration;
    config.numTestEpisodes = numTestEpisodes;
    config.randomInit = randomInit;
    config.greedyRatio = greedyRatio;
    config.hiddenSize = hiddenSize;
    config.modelFileToLoad = modelFileToLoad;
    config.outputDirectory = outputDirectory;

    std::unique_ptr<Gym::Communicator> communicator;
    std::unique_ptr<Environment> environment;
    std::unique_ptr<Environment> testEnvironment;
    try
    {
        if (envName == "Bandit")
        {
            spdlog::info("Creating {}-armed bandit tasks", banditArms);
            // Training draws a new task every epoch; evaluation keeps its own task
            environment = std::make_unique<BanditEnvironment>(banditArms, banditPulls, numberOfTrajectories);
            testEnvironment = std::make_unique<BanditEnvironment>(banditArms, banditPulls, numTestEpisodes);
        }
        else
        {
            spdlog::info("Connecting to the Gym Environment");
            communicator = std::make_unique<Gym::Communicator>(gymServerUrl);
            environment = std::make_unique<GymEnvironment>(*communicator, envName, seed);
        }
    }
    catch (const std::exception &error)
    {
        spdlog::error("Could not create environment {}: {}", envName, error.what());
        return 1;
    }
    Environment &evaluationEnvironment = testEnvironment ? *testEnvironment : *environment;

    try
    {
        EpochLogger logger(config.outputDirectory);
        logger.saveConfig(config);

        auto actorCritic = ActorCritic(environment->observationSize(), environment->actionSpace(), config.hiddenSize);
        actorCritic->to(device);

        Sac sac(actorCritic, config);
        EpisodicBuffer buffer(config.numberOfTrajectories * config.maxEpLen,
                              environment->observationSize(),
                              config.hiddenSize,
                              config.explorationSampling,
                              device);
        TrainerState state;

        TrainingLoop training(*environment, actorCritic, sac, buffer, logger, config, state);
        training.run();

        spdlog::info("Evaluating the trained agent");
        EvaluationLoop evaluation(evaluationEnvironment, actorCritic, logger, config, state);
        auto trace = evaluation.run();
        spdlog::info("Evaluated {} trajectories, {} environment steps", trace.rewards.size(), state.globalTestSteps);
    }
    catch (const std::exception &error)
    {
        spdlog::error("Training failed: {}", error.what());
        return 1;
    }

    return 0;
}
