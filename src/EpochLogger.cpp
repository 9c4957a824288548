//
// Created by moinshaikh on 2/12/26.
//

#include<algorithm>
#include<cmath>
#include<filesystem>
#include<fstream>
#include<limits>
#include<sstream>
#include<stdexcept>

#include<msgpack.hpp>
#include<nlohmann/json.hpp>
#include<spdlog/spdlog.h>
#include<spdlog/sinks/basic_file_sink.h>
#include<torch/torch.h>

#include"../include/EpochLogger.hpp"

#include<doctest/doctest.h>

namespace MetaSac
{
    EpochLogger::EpochLogger(const std::string &outputDirectory) :
    outputDirectory(outputDirectory),
    firstRow(true)
    {
        std::filesystem::create_directories(outputDirectory);
        auto progressPath = (std::filesystem::path(outputDirectory) / "progress.txt").string();

        // Kept out of spdlog's registry so several loggers may target different runs
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(progressPath, true);
        progressLogger = std::make_shared<spdlog::logger>("progress", sink);
        progressLogger->set_pattern("%v");
        progressLogger->flush_on(spdlog::level::info);

        auto metricsPath = (std::filesystem::path(outputDirectory) / "metrics.jsonl").string();
        metricsLogger = std::make_shared<spdlog::logger>(
            "metrics", std::make_shared<spdlog::sinks::basic_file_sink_mt>(metricsPath, true));
        metricsLogger->set_pattern("%v");
        metricsLogger->flush_on(spdlog::level::info);

        spdlog::info("Logging data to {}", progressPath);
    }

    void EpochLogger::store(const std::string &name, double value)
    {
        epochValues[name].push_back(value);
    }

    void EpochLogger::store(const std::string &name, torch::Tensor values)
    {
        auto flat = values.detach().to(torch::kCPU).to(torch::kDouble).contiguous().view({-1});
        auto &stored = epochValues[name];
        stored.insert(stored.end(), flat.data_ptr<double>(), flat.data_ptr<double>() + flat.numel());
    }

    void EpochLogger::store(const std::vector<UpdateDatum> &data)
    {
        for (const auto &datum : data)
        {
            store(datum.name, datum.value);
        }
    }

    size_t EpochLogger::count(const std::string &name) const
    {
        auto values = epochValues.find(name);
        return values == epochValues.end() ? 0 : values->second.size();
    }

    Statistics EpochLogger::getStats(const std::string &name) const
    {
        auto values = epochValues.find(name);
        if (values == epochValues.end() || values->second.empty())
        {
            throw std::runtime_error("No values stored under " + name);
        }
        const auto &stored = values->second;

        double sum = 0;
        double min = std::numeric_limits<double>::infinity();
        double max = -std::numeric_limits<double>::infinity();
        for (auto value : stored)
        {
            sum += value;
            min = std::min(min, value);
            max = std::max(max, value);
        }
        const double mean = sum / stored.size();

        double squares = 0;
        for (auto value : stored)
        {
            squares += (value - mean) * (value - mean);
        }
        return {mean, std::sqrt(squares / stored.size()), min, max};
    }

    Statistics EpochLogger::takeStats(const std::string &name)
    {
        auto statistics = getStats(name);
        epochValues.erase(name);
        return statistics;
    }

    void EpochLogger::setColumn(const std::string &key, double value)
    {
        auto existing = std::find_if(currentRow.begin(), currentRow.end(),
                                     [&key](const auto &column) { return column.first == key; });
        if (existing != currentRow.end())
        {
            throw std::runtime_error("Column " + key + " already set in this row");
        }
        currentRow.emplace_back(key, value);
    }

    void EpochLogger::logTabular(const std::string &key, double value)
    {
        setColumn(key, value);
    }

    void EpochLogger::logStatistics(const std::string &key, bool withMinAndMax, bool averageOnly)
    {
        auto statistics = getStats(key);
        setColumn("Average" + key, statistics.mean);
        if (!averageOnly)
        {
            setColumn("Std" + key, statistics.std);
        }
        if (withMinAndMax)
        {
            setColumn("Max" + key, statistics.max);
            setColumn("Min" + key, statistics.min);
        }
        epochValues.erase(key);
    }

    /**
     * @brief Prints the row and appends it to progress.txt
     *
     * The first call fixes the column order and writes the header line.
     */
    void EpochLogger::dumpTabular()
    {
        if (firstRow)
        {
            for (const auto &column : currentRow)
            {
                headers.push_back(column.first);
            }
        }
        else
        {
            for (const auto &column : currentRow)
            {
                if (std::find(headers.begin(), headers.end(), column.first) == headers.end())
                {
                    throw std::runtime_error("Trying to introduce a new key " + column.first +
                                             " that was not included in the first dump");
                }
            }
        }

        std::ostringstream line;
        spdlog::info("{:-^40}", "");
        for (size_t i = 0; i < headers.size(); ++i)
        {
            auto column = std::find_if(currentRow.begin(), currentRow.end(),
                                       [&](const auto &entry) { return entry.first == headers[i]; });
            if (i > 0)
            {
                line << '\t';
            }
            if (column != currentRow.end())
            {
                spdlog::info("| {:>20} | {:>13.6g} |", column->first, column->second);
                line << column->second;
            }
        }
        spdlog::info("{:-^40}", "");

        if (firstRow)
        {
            std::ostringstream header;
            for (size_t i = 0; i < headers.size(); ++i)
            {
                header << (i > 0 ? "\t" : "") << headers[i];
            }
            progressLogger->info(header.str());
            firstRow = false;
        }
        progressLogger->info(line.str());

        currentRow.clear();
    }

    void EpochLogger::saveConfig(const SacConfig &config)
    {
        msgpack::sbuffer buffer;
        msgpack::pack(buffer, config);

        auto handle = msgpack::unpack(buffer.data(), buffer.size());
        std::ostringstream description;
        description << handle.get();
        spdlog::info("Saving config: {}", description.str());

        auto configPath = std::filesystem::path(outputDirectory) / "config.msgpack";
        std::ofstream file(configPath, std::ios::binary);
        if (!file)
        {
            throw std::runtime_error("Cannot write " + configPath.string());
        }
        file.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    }

    void EpochLogger::scalar(const std::string &tag, double value, int64_t step)
    {
        nlohmann::json point = {
            {"tag", tag},
            {"step", step},
            {"value", value},
            {"type", "scalar"}
        };
        metricsLogger->info(point.dump());
    }

    namespace
    {
        std::vector<std::string> readLines(const std::filesystem::path &path)
        {
            std::ifstream file(path);
            std::vector<std::string> lines;
            std::string line;
            while (std::getline(file, line))
            {
                lines.push_back(line);
            }
            return lines;
        }
    }

    TEST_CASE("EpochLogger")
    {
        auto directory = std::filesystem::temp_directory_path() / "metasac_logger_test";
        std::filesystem::remove_all(directory);

        SUBCASE("getStats() summarises the stored values")
        {
            EpochLogger logger(directory.string());
            logger.store("EpRew", 1.);
            logger.store("EpRew", 3.);
            logger.store("EpRew", torch::tensor({2.f, 6.f}));

            auto statistics = logger.getStats("EpRew");
            CHECK(statistics.mean == doctest::Approx(3));
            CHECK(statistics.std == doctest::Approx(std::sqrt(3.5)));
            CHECK(statistics.min == doctest::Approx(1));
            CHECK(statistics.max == doctest::Approx(6));
            CHECK(logger.count("EpRew") == 4);
        }

        SUBCASE("Update data are stored by name")
        {
            EpochLogger logger(directory.string());
            logger.store(std::vector<UpdateDatum>{{"LossQ", torch::tensor(1.f)},
                                                  {"LossQ", torch::tensor(2.f)},
                                                  {"LogPi", torch::tensor({{-0.5f, -1.f}, {-2.f, -0.5f}})},
                                                  {"Alpha", torch::scalar_tensor(0.2)}});

            CHECK(logger.getStats("LossQ").mean == doctest::Approx(1.5));
            CHECK(logger.count("Alpha") == 1);
            CHECK(logger.count("LogPi") == 4);
            CHECK(logger.getStats("LogPi").min == doctest::Approx(-2));
        }

        SUBCASE("takeStats() consumes the values")
        {
            EpochLogger logger(directory.string());
            logger.store("TestEpLen", 4.);
            logger.store("TestEpLen", 6.);

            CHECK(logger.takeStats("TestEpLen").mean == doctest::Approx(5));
            CHECK(logger.count("TestEpLen") == 0);
        }

        SUBCASE("Asking for an unknown name throws")
        {
            EpochLogger logger(directory.string());
            CHECK_THROWS_AS(logger.getStats("Missing"), std::runtime_error);
        }

        SUBCASE("dumpTabular() writes a header and one row per dump")
        {
            {
                EpochLogger logger(directory.string());
                logger.store("EpRew", 2.);
                logger.logTabular("Trial", 0.);
                logger.logStatistics("EpRew", true);
                logger.dumpTabular();

                CHECK(logger.count("EpRew") == 0);

                logger.store("EpRew", 4.);
                logger.logTabular("Trial", 1.);
                logger.logStatistics("EpRew", true);
                logger.dumpTabular();
            }

            auto lines = readLines(directory / "progress.txt");
            REQUIRE(lines.size() == 3);
            CHECK(lines[0] == "Trial\tAverageEpRew\tStdEpRew\tMaxEpRew\tMinEpRew");
            CHECK(lines[2].rfind("1\t4", 0) == 0);
        }

        SUBCASE("Later dumps may not add columns")
        {
            EpochLogger logger(directory.string());
            logger.logTabular("Trial", 0.);
            logger.dumpTabular();
            logger.logTabular("Other", 1.);

            CHECK_THROWS_AS(logger.dumpTabular(), std::runtime_error);
        }

        SUBCASE("scalar() appends one JSON point per line")
        {
            {
                EpochLogger logger(directory.string());
                logger.scalar("Performance/AverageEpRew", 1.5, 10);
                logger.scalar("Loss/LossQ", 0.25, 20);
            }

            auto lines = readLines(directory / "metrics.jsonl");
            REQUIRE(lines.size() == 2);
            auto first = nlohmann::json::parse(lines[0]);
            CHECK(first["tag"].get<std::string>() == "Performance/AverageEpRew");
            CHECK(first["step"].get<int64_t>() == 10);
            CHECK(first["value"].get<double>() == doctest::Approx(1.5));
            CHECK(first["type"].get<std::string>() == "scalar");
            auto second = nlohmann::json::parse(lines[1]);
            CHECK(second["tag"].get<std::string>() == "Loss/LossQ");
            CHECK(second["step"].get<int64_t>() == 20);
        }

        SUBCASE("saveConfig() writes a readable msgpack file")
        {
            EpochLogger logger(directory.string());
            SacConfig config;
            config.batchSize = 7;
            logger.saveConfig(config);

            std::ifstream file(directory / "config.msgpack", std::ios::binary);
            std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            auto handle = msgpack::unpack(bytes.data(), bytes.size());
            auto loaded = handle.get().as<SacConfig>();

            CHECK(loaded.batchSize == 7);
            CHECK(loaded.polyak == doctest::Approx(0.995));
        }

        std::filesystem::remove_all(directory);
    }
}
