#include "AppConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cstdint>

namespace config
{

namespace
{

void warnInvalid(const std::string& key, const std::string& details)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Invalid configuration value for '" + key + "', keeping default", details);
}

std::vector<std::string> readStringArray(const toml::table& section, const std::string& key)
{
    std::vector<std::string> values;
    const auto* arr = section[key].as_array();
    if (!arr)
        return values;

    for (auto&& node : *arr)
    {
        if (auto v = node.value<std::string>())
            values.push_back(*v);
        else
            warnInvalid(key, "array entries must be strings");
    }
    return values;
}

} // namespace

void AppConfig::applyDefaults()
{
    algorithm = matching::Algorithm::Levenshtein;
    max_workers = 0;
    ngram_size = 2;
    debug = false;
    verbose = false;

    for (auto algo : matching::allAlgorithms())
        thresholds[static_cast<std::size_t>(algo)] = matching::defaultThreshold(algo);

    raw_dir = "data/raw";
    reference_file = "data/reference.csv";
    validation_dir = "data/validation";
    output_dir = "data/evaluation";

    jobs.clear();
    column_aliases = { { "CONTACT", "FULLNAME" } };
    datasets = { "STREET", "FULLNAME", "BOTH" };
    evaluation_algorithms.assign(matching::allAlgorithms().begin(), matching::allAlgorithms().end());
    logging = utils::LogSettings{};
}

double AppConfig::threshold(matching::Algorithm algo) const
{
    return thresholds.at(static_cast<std::size_t>(algo));
}

bool AppConfig::setThreshold(matching::Algorithm algo, double value)
{
    if (!(value >= 0.0 && value <= 1.0))
        return false;
    thresholds.at(static_cast<std::size_t>(algo)) = value;
    return true;
}

std::string AppConfig::referenceColumnFor(const std::string& query_column) const
{
    auto it = column_aliases.find(query_column);
    return it == column_aliases.end() ? query_column : it->second;
}

matching::MatcherOptions AppConfig::matcherOptions() const
{
    matching::MatcherOptions options;
    options.ngram_size = ngram_size;
    return options;
}

void AppConfig::registerConfigHandlers(ConfigManager& manager)
{
    manager.registerTable("matching", { [this](const toml::table& t) { loadMatching(t); } },
                          { "algorithm", "max_workers", "ngram_size", "debug", "verbose" });
    manager.registerTable("thresholds", { [this](const toml::table& t) { loadThresholds(t); } },
                          { "levenshtein", "jaccard", "dice", "ngram", "regex", "tfidf" });
    manager.registerTable("paths", { [this](const toml::table& t) { loadPaths(t); } },
                          { "raw_dir", "reference_file", "validation_dir", "output_dir" });
    manager.registerTable("", { [this](const toml::table& t) { loadRoot(t); } }, { "jobs" });
    manager.registerTable("column_aliases", { [this](const toml::table& t) { loadAliases(t); } }, {});
    manager.registerTable("evaluation", { [this](const toml::table& t) { loadEvaluation(t); } },
                          { "datasets", "algorithms" });
    manager.registerTable("logging", { [this](const toml::table& t) { loadLogging(t); } },
                          { "directory", "level", "append", "max_file_size_mb", "backup_count" });
}

void AppConfig::loadMatching(const toml::table& section)
{
    if (auto v = section["algorithm"].value<std::string>())
    {
        if (auto parsed = matching::parseAlgorithm(*v))
            algorithm = *parsed;
        else
            warnInvalid("matching.algorithm", "unknown algorithm '" + *v + "'");
    }
    if (auto v = section["max_workers"].value<int64_t>())
    {
        if (*v >= 0)
            max_workers = static_cast<std::size_t>(*v);
        else
            warnInvalid("matching.max_workers", "must not be negative");
    }
    if (auto v = section["ngram_size"].value<int64_t>())
    {
        if (*v >= 1)
            ngram_size = static_cast<std::size_t>(*v);
        else
            warnInvalid("matching.ngram_size", "must be at least 1");
    }
    if (auto v = section["debug"].value<bool>())
        debug = *v;
    if (auto v = section["verbose"].value<bool>())
        verbose = *v;
}

void AppConfig::loadThresholds(const toml::table& section)
{
    for (auto algo : matching::allAlgorithms())
    {
        const std::string key = matching::algorithmName(algo);
        if (!section.contains(key))
            continue;

        auto v = section[key].value<double>();
        if (!v)
            warnInvalid("thresholds." + key, "must be a number");
        else if (!setThreshold(algo, *v))
            warnInvalid("thresholds." + key, "value " + std::to_string(*v) + " outside [0, 1]");
    }
}

void AppConfig::loadPaths(const toml::table& section)
{
    if (auto v = section["raw_dir"].value<std::string>())
        raw_dir = *v;
    if (auto v = section["reference_file"].value<std::string>())
        reference_file = *v;
    if (auto v = section["validation_dir"].value<std::string>())
        validation_dir = *v;
    if (auto v = section["output_dir"].value<std::string>())
        output_dir = *v;
}

void AppConfig::loadRoot(const toml::table& root)
{
    auto* arr = root["jobs"].as_array();
    if (!arr)
        return;

    jobs.clear();
    for (auto&& node : *arr)
    {
        const auto* tbl = node.as_table();
        auto file = tbl ? (*tbl)["file"].value<std::string>() : std::nullopt;
        if (!file || file->empty())
        {
            warnInvalid("jobs", "every [[jobs]] entry needs a file");
            continue;
        }

        MatchJob job;
        job.file = *file;
        job.columns = readStringArray(*tbl, "columns");
        if (job.columns.empty())
        {
            warnInvalid("jobs", "job '" + job.file + "' has no columns");
            continue;
        }
        jobs.push_back(std::move(job));
    }
    PLOG_DEBUG << "Configured " << jobs.size() << " matching jobs";
}

void AppConfig::loadAliases(const toml::table& section)
{
    for (auto&& [key, node] : section)
    {
        if (auto v = node.value<std::string>())
            column_aliases[std::string(key.str())] = *v;
        else
            warnInvalid("column_aliases." + std::string(key.str()), "must be a string");
    }
}

void AppConfig::loadEvaluation(const toml::table& section)
{
    if (section.contains("datasets"))
    {
        auto values = readStringArray(section, "datasets");
        if (!values.empty())
            datasets = std::move(values);
        else
            warnInvalid("evaluation.datasets", "needs at least one dataset");
    }

    if (section.contains("algorithms"))
    {
        std::vector<matching::Algorithm> parsed;
        for (const auto& name : readStringArray(section, "algorithms"))
        {
            if (auto algo = matching::parseAlgorithm(name))
                parsed.push_back(*algo);
            else
                warnInvalid("evaluation.algorithms", "unknown algorithm '" + name + "'");
        }
        if (!parsed.empty())
            evaluation_algorithms = std::move(parsed);
    }
}

void AppConfig::loadLogging(const toml::table& section)
{
    if (auto v = section["directory"].value<std::string>())
    {
        if (!v->empty())
            logging.directory = *v;
        else
            warnInvalid("logging.directory", "must not be empty");
    }
    // plog severities: 0 none, 1 fatal, 2 error, 3 warning, 4 info, 5 debug, 6 verbose
    if (auto v = section["level"].value<int64_t>())
    {
        if (*v >= plog::none && *v <= plog::verbose)
            logging.level = static_cast<plog::Severity>(*v);
        else
            warnInvalid("logging.level", "must be within 0..6");
    }
    if (auto v = section["append"].value<bool>())
        logging.append = *v;
    if (auto v = section["max_file_size_mb"].value<int64_t>())
    {
        if (*v >= 1)
            logging.max_file_size = static_cast<std::size_t>(*v) * 1024 * 1024;
        else
            warnInvalid("logging.max_file_size_mb", "must be at least 1");
    }
    if (auto v = section["backup_count"].value<int64_t>())
    {
        if (*v >= 0)
            logging.backup_count = static_cast<std::size_t>(*v);
        else
            warnInvalid("logging.backup_count", "must not be negative");
    }
}

} // namespace config
