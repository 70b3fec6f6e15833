#pragma once

#include "matching/MatchTypes.hpp"
#include "utils/LogManager.hpp"

#include <toml++/toml.h>

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace config
{

class ConfigManager;

// One query file and the columns of it to match against the reference table
struct MatchJob
{
    std::string file;
    std::vector<std::string> columns;
};

/**
 * @brief Application settings read from reclink.toml.
 *
 * Invalid values are reported as Configuration warnings and leave the
 * default in place.
 */
struct AppConfig
{
    // [matching]
    matching::Algorithm algorithm = matching::Algorithm::Levenshtein;
    std::size_t max_workers = 0; // 0 = WorkerPool::DefaultWorkerCount()
    std::size_t ngram_size = 2;
    bool debug = false;
    bool verbose = false;

    // [thresholds], indexed by matching::Algorithm
    std::array<double, 6> thresholds{};

    // [paths]
    std::string raw_dir;
    std::string reference_file;
    std::string validation_dir;
    std::string output_dir;

    // [[jobs]]
    std::vector<MatchJob> jobs;

    // [column_aliases] query column -> reference column
    std::map<std::string, std::string> column_aliases;

    // [evaluation]
    std::vector<std::string> datasets;
    std::vector<matching::Algorithm> evaluation_algorithms;

    // [logging]
    utils::LogSettings logging;

    AppConfig() { applyDefaults(); }

    void applyDefaults();

    double threshold(matching::Algorithm algorithm) const;

    // Returns false (and keeps the old value) outside [0, 1]
    bool setThreshold(matching::Algorithm algorithm, double value);

    std::string referenceColumnFor(const std::string& query_column) const;

    matching::MatcherOptions matcherOptions() const;

    void registerConfigHandlers(ConfigManager& manager);

private:
    void loadMatching(const toml::table& section);
    void loadThresholds(const toml::table& section);
    void loadPaths(const toml::table& section);
    void loadRoot(const toml::table& root);
    void loadAliases(const toml::table& section);
    void loadEvaluation(const toml::table& section);
    void loadLogging(const toml::table& section);
};

} // namespace config
