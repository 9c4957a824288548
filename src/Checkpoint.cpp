//
// Created by moinshaikh on 2/12/26.
//

#include<filesystem>
#include<stdexcept>
#include<string>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../include/Checkpoint.hpp"
#include"../include/Model/ActorCritic.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    std::string saveCheckpoint(ActorCritic &actorCritic,
                               torch::Tensor logAlpha,
                               const std::string &directory,
                               const std::string &tag)
    {
        auto saveDirectory = std::filesystem::path(directory) / "pyt_save";
        std::filesystem::create_directories(saveDirectory);

        auto modelPath = (saveDirectory / ("model" + tag + ".pt")).string();
        torch::save(actorCritic, modelPath);
        if (logAlpha.defined())
        {
            torch::save(logAlpha.detach(), (saveDirectory / ("log_alpha" + tag + ".pt")).string());
        }
        spdlog::info("Saved model to {}", modelPath);
        return modelPath;
    }

    void loadCheckpoint(const std::string &path, ActorCritic &actorCritic)
    {
        if (!std::filesystem::exists(path))
        {
            throw std::runtime_error("Checkpoint not found: " + path);
        }
        torch::load(actorCritic, path, actorCritic->getDevice());
        spdlog::info("Loaded model from {}", path);
    }

    std::string logAlphaCheckpointPath(const std::string &modelPath)
    {
        const std::string prefix = "model";
        auto path = std::filesystem::path(modelPath);
        auto filename = path.filename().string();
        if (filename.compare(0, prefix.size(), prefix) == 0)
        {
            filename.replace(0, prefix.size(), "log_alpha");
        }
        else
        {
            filename = "log_alpha_" + filename;
        }
        return (path.parent_path() / filename).string();
    }

    torch::Tensor loadLogAlpha(const std::string &path)
    {
        if (!std::filesystem::exists(path))
        {
            throw std::runtime_error("log_alpha checkpoint not found: " + path);
        }
        torch::Tensor logAlpha;
        torch::load(logAlpha, path);
        return logAlpha;
    }

    TEST_CASE("Checkpoint")
    {
        ActionSpace space{"Discrete", {3}};
        auto directory = (std::filesystem::temp_directory_path() / "metasac_checkpoint_test").string();
        std::filesystem::remove_all(directory);

        SUBCASE("Saved parameters are restored into a fresh model")
        {
            auto saved = ActorCritic(4, space, 8);
            auto path = saveCheckpoint(saved, torch::full({1}, 0.5), directory, "_1_2");

            CHECK(path == (std::filesystem::path(directory) / "pyt_save" / "model_1_2.pt").string());
            CHECK(std::filesystem::exists(std::filesystem::path(directory) / "pyt_save" / "log_alpha_1_2.pt"));

            auto loaded = ActorCritic(4, space, 8);
            loadCheckpoint(path, loaded);
            for (size_t i = 0; i < saved->parameters().size(); ++i)
            {
                CHECK(torch::equal(saved->parameters()[i], loaded->parameters()[i]));
            }

            auto logAlpha = loadLogAlpha((std::filesystem::path(directory) / "pyt_save" / "log_alpha_1_2.pt").string());
            CHECK(logAlpha.item().toDouble() == doctest::Approx(0.5));
        }

        SUBCASE("The log_alpha file is found from the model file")
        {
            auto model = ActorCritic(4, space, 8);
            auto path = saveCheckpoint(model, torch::full({1}, -0.25), directory, "_3_9");

            auto logAlphaPath = logAlphaCheckpointPath(path);
            CHECK(logAlphaPath == (std::filesystem::path(directory) / "pyt_save" / "log_alpha_3_9.pt").string());
            CHECK(loadLogAlpha(logAlphaPath).item().toDouble() == doctest::Approx(-0.25));

            CHECK(logAlphaCheckpointPath("runs/final.pt") ==
                  (std::filesystem::path("runs") / "log_alpha_final.pt").string());
        }

        SUBCASE("Undefined log_alpha is not written")
        {
            auto model = ActorCritic(4, space, 8);
            saveCheckpoint(model, torch::Tensor(), directory, "_0_0");

            CHECK(!std::filesystem::exists(std::filesystem::path(directory) / "pyt_save" / "log_alpha_0_0.pt"));
        }

        SUBCASE("Loading a missing file throws")
        {
            auto model = ActorCritic(4, space, 8);

            CHECK_THROWS_AS(loadCheckpoint(directory + "/missing.pt", model), std::runtime_error);
            CHECK_THROWS_AS(loadLogAlpha(directory + "/missing.pt"), std::runtime_error);
        }

        std::filesystem::remove_all(directory);
    }
}
