#pragma once
//
// Created by moinshaikh on 2/12/26.
//

#ifndef METASAC_EPOCHLOGGER_HPP
#define METASAC_EPOCHLOGGER_HPP

#include<cstdint>
#include<map>
#include<memory>
#include<string>
#include<utility>
#include<vector>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"Algorithms/Algorithm.hpp"
#include"Config.hpp"

namespace MetaSac
{
    /**
     * @brief Summary of the values stored under one name
     */
    struct Statistics
    {
        double mean;
        double std;   ///< Population standard deviation
        double min;
        double max;
    };

    /**
     * @class EpochLogger
     * @brief Collects named scalars over a logging period and writes them as one table row.
     *
     * Values are accumulated with store(). At the end of a period, logStatistics() turns them
     * into columns, logTabular() adds a directly supplied value, and dumpTabular() prints the row through
     * spdlog and appends it to `<outputDirectory>/progress.txt` as tab-separated text. The
     * columns of the first dump define the header; later dumps may leave a column empty but
     * may not add new ones.
     *
     * scalar() writes individual points of named time series, one JSON object per line of
     * `<outputDirectory>/metrics.jsonl`, for plotting progress against environment steps.
     */
    class EpochLogger
    {
    private:
        std::string outputDirectory;
        std::shared_ptr<spdlog::logger> progressLogger;          ///< File logger writing progress.txt
        std::shared_ptr<spdlog::logger> metricsLogger;           ///< File logger writing metrics.jsonl
        std::map<std::string, std::vector<double>> epochValues;
        std::vector<std::pair<std::string, double>> currentRow;
        std::vector<std::string> headers;
        bool firstRow;

        void setColumn(const std::string &key, double value);
    public:
        /**
         * @param outputDirectory Directory for progress.txt, metrics.jsonl and config.msgpack;
         *        created if missing.
         */
        explicit EpochLogger(const std::string &outputDirectory);

        void store(const std::string &name, double value);

        /** @brief Stores every element of `values` under `name` */
        void store(const std::string &name, torch::Tensor values);

        /** @brief Stores every datum of an update under its own name */
        void store(const std::vector<UpdateDatum> &data);

        /**
         * @throws std::runtime_error if nothing was stored under `name` in this period.
         */
        Statistics getStats(const std::string &name) const;

        /** @brief getStats() followed by dropping the values stored under `name` */
        Statistics takeStats(const std::string &name);

        /** @brief Sets column `key` of the current row */
        void logTabular(const std::string &key, double value);

        /**
         * @brief Adds the statistics of the values stored under `key` to the current row
         *
         * Columns: Average<key>, Std<key> (unless averageOnly), Max<key> and Min<key> (if
         * withMinAndMax). The stored values are consumed.
         */
        void logStatistics(const std::string &key, bool withMinAndMax = false, bool averageOnly = false);

        /**
         * @brief Writes the current row and starts a new one
         *
         * @throws std::runtime_error if the row introduces a column absent from the first dump.
         */
        void dumpTabular();

        /** @brief Logs every field of `config` and writes it to config.msgpack */
        void saveConfig(const SacConfig &config);

        /** @return Number of values stored under `name` in this period */
        size_t count(const std::string &name) const;

        /**
         * @brief Appends one point of the time series `tag` to metrics.jsonl
         *
         * Each line is a JSON object `{"step", "tag", "type": "scalar", "value"}`.
         */
        void scalar(const std::string &tag, double value, int64_t step);

    };
}

#endif //METASAC_EPOCHLOGGER_HPP
