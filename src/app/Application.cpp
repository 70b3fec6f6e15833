#include "Application.hpp"

#include "config/AppConfig.hpp"
#include "config/ConfigManager.hpp"
#include "data/Csv.hpp"
#include "data/SampleData.hpp"
#include "data/Table.hpp"
#include "data/ValidationStore.hpp"
#include "evaluation/Evaluator.hpp"
#include "matching/MatchRunner.hpp"
#include "processing/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>

#ifndef RECLINK_VERSION
#define RECLINK_VERSION "0.0.0"
#endif

namespace
{

constexpr const char* kDebugSampleFile = "debug_sample";
constexpr std::size_t kMaxSummaryLines = 20;

bool parseCount(const char* text, std::size_t& out)
{
    if (!text || !*text)
        return false;
    char* end = nullptr;
    const long long value = std::strtoll(text, &end, 10);
    if (*end != '\0' || value < 0)
        return false;
    out = static_cast<std::size_t>(value);
    return true;
}

} // namespace

Application::Application(int argc, char** argv) : argc_(argc), argv_(argv) {}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

Application::Options Application::ParseArguments(int argc, char** argv)
{
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        auto next = [&](const char* flag) -> const char*
        {
            if (i + 1 >= argc)
            {
                options.error = std::string(flag) + " requires a value";
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            options.help = true;
        }
        else if (std::strcmp(arg, "--version") == 0)
        {
            options.version = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            options.verbose = true;
        }
        else if (std::strcmp(arg, "--debug") == 0)
        {
            options.debug = true;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            if (const char* value = next("--config"))
                options.config_path = value;
        }
        else if (std::strcmp(arg, "--algorithm") == 0)
        {
            if (const char* value = next("--algorithm"))
            {
                if (matching::parseAlgorithm(value))
                    options.algorithm = value;
                else
                    options.error = std::string("unknown algorithm '") + value + "'";
            }
        }
        else if (std::strcmp(arg, "--workers") == 0)
        {
            if (const char* value = next("--workers"))
            {
                std::size_t workers = 0;
                if (parseCount(value, workers))
                    options.workers = workers;
                else
                    options.error = std::string("invalid worker count '") + value + "'";
            }
        }
        else if (arg[0] == '-')
        {
            options.error = std::string("unknown option '") + arg + "'";
        }
        else if (options.command)
        {
            options.error = std::string("unexpected argument '") + arg + "'";
        }
        else if (std::strcmp(arg, "match") == 0)
        {
            options.command = Command::Match;
        }
        else if (std::strcmp(arg, "evaluate") == 0)
        {
            options.command = Command::Evaluate;
        }
        else
        {
            options.error = std::string("unknown command '") + arg + "'";
        }

        if (!options.error.empty())
            break;
    }

    if (options.error.empty() && !options.command && !options.help && !options.version)
        options.error = "no command given";
    return options;
}

void Application::PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " <match|evaluate> [OPTIONS]\n";
    std::cout << "Approximate record linkage of names and addresses\n\n";
    std::cout << "Commands:\n";
    std::cout << "  match                Match every configured query file against the reference table\n";
    std::cout << "                       and export the results for validation\n";
    std::cout << "  evaluate             Compute metrics from validated result files\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE        Configuration file (default: reclink.toml)\n";
    std::cout << "  --algorithm NAME     levenshtein, jaccard, dice, ngram, regex or tfidf\n";
    std::cout << "  --workers N          Worker threads, 0 = min(32, cores + 4)\n";
    std::cout << "  --debug              Match the built-in sample streets instead of input files\n";
    std::cout << "  --verbose            Log per-stage details to logs/matching.log\n";
    std::cout << "  --version            Show version information\n";
    std::cout << "  --help               Show this help message\n";
}

void Application::PrintVersion()
{
    std::cout << "reclink record linkage\n";
    std::cout << "Version: " << RECLINK_VERSION << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

int Application::run()
{
    options_ = ParseArguments(argc_, argv_);
    const char* program = argc_ > 0 ? argv_[0] : "reclink";

    if (options_.help)
    {
        PrintUsage(program);
        return kExitSuccess;
    }
    if (options_.version)
    {
        PrintVersion();
        return kExitSuccess;
    }
    if (!options_.error.empty())
    {
        std::cerr << "ERROR: " << options_.error << "\n\n";
        PrintUsage(program);
        return kExitUsage;
    }

    // Config first: the [logging] section decides where the logs go. Problems found
    // before the loggers exist are queued by ErrorReporter and shown in the summary.
    const bool config_ok = initializeConfig();
    if (!initializeLogging())
    {
        std::cerr << "ERROR: failed to initialize logging\n";
        printErrorSummary();
        return kExitFailure;
    }
    logConfiguration(config_ok);

    const int code = *options_.command == Command::Match ? runMatch() : runEvaluate();
    PROFILE_FLUSH();
    printErrorSummary();
    return code;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_->logging))
        return false;

    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filename = "reclink.log",
                                                     .level_override = std::nullopt,
                                                     .add_console_appender = true });

    ok = utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
             { .name = "matching",
               .filename = "matching.log",
               .level_override = config_->verbose ? std::optional<plog::Severity>(plog::debug) : std::nullopt,
               .add_console_appender = false }) &&
         ok;

#if RECLINK_PROFILING_LEVEL >= 1
    ok = utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                                               .filename = "profiling.log",
                                                                               .level_override = plog::debug,
                                                                               .add_console_appender = false }) &&
         ok;
#endif

    return ok;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<config::AppConfig>();
    config_manager_ = std::make_unique<config::ConfigManager>(options_.config_path);
    config_->registerConfigHandlers(*config_manager_);
    const bool ok = config_manager_->load();

    if (options_.algorithm)
    {
        if (auto algorithm = matching::parseAlgorithm(*options_.algorithm))
            config_->algorithm = *algorithm;
    }
    if (options_.workers)
        config_->max_workers = *options_.workers;
    if (options_.verbose)
        config_->verbose = true;
    if (options_.debug)
        config_->debug = true;

    processing::Diagnostics::SetVerbose(config_->verbose);
    return ok;
}

void Application::logConfiguration(bool config_ok) const
{
    if (!config_ok)
    {
        PLOG_WARNING << "Continuing with default configuration: " << config_manager_->lastError();
    }
    PLOG_INFO << "Configuration " << (config_manager_->fileFound() ? config_manager_->configPath() : "defaults")
              << ": algorithm=" << matching::algorithmName(config_->algorithm)
              << " threshold=" << config_->threshold(config_->algorithm) << " jobs=" << config_->jobs.size()
              << (config_->debug ? " (debug sample data)" : "");
}

int Application::runMatch()
{
    PROFILE_SCOPE_FUNCTION();
    const auto start = std::chrono::steady_clock::now();

    if (config_->debug)
    {
        const data::Table reference = data::sampleReference();
        const data::Table queries = data::sampleQueries();
        return runJob(reference, queries, kDebugSampleFile, { "STREET" }) ? kExitSuccess : kExitFailure;
    }

    if (config_->jobs.empty())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "No matching jobs configured",
                                          "add [[jobs]] entries to " + config_manager_->configPath());
        return kExitFailure;
    }

    data::Table reference;
    try
    {
        reference = data::readCsv(config_->reference_file);
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Input, "Reference table unavailable", ex.what());
        return kExitFailure;
    }
    data::applyStandardDerivations(reference);
    PLOG_INFO << "Reference table " << config_->reference_file << ": " << reference.rowCount() << " rows";

    std::size_t loaded = 0;
    std::size_t exported = 0;
    for (const auto& job : config_->jobs)
    {
        const std::filesystem::path path = std::filesystem::path(config_->raw_dir) / job.file;
        data::Table queries;
        try
        {
            queries = data::readCsv(path);
        }
        catch (const std::exception& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Query file skipped", ex.what());
            continue;
        }
        data::applyStandardDerivations(queries);
        ++loaded;
        if (runJob(reference, queries, job.file, job.columns))
            ++exported;
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    PLOG_INFO << "Matching finished: " << loaded << "/" << config_->jobs.size() << " files read, " << exported
              << " exported in " << elapsed.count() << "ms";

    if (loaded == 0)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Input, "No query file could be read",
                                          "raw_dir=" + config_->raw_dir);
        return kExitFailure;
    }
    return kExitSuccess;
}

bool Application::runJob(const data::Table& reference, const data::Table& queries, const std::string& file,
                         const std::vector<std::string>& columns)
{
    const matching::MatchRunner runner(config_->algorithm, config_->threshold(config_->algorithm),
                                       config_->max_workers, config_->matcherOptions());
    const data::ValidationStore store(config_->validation_dir, config_->output_dir);

    bool any = false;
    for (const auto& column : columns)
    {
        const std::string reference_column = config_->referenceColumnFor(column);
        PLOG_INFO << "Matching " << file << " column " << column << " against " << reference_column << " with "
                  << matching::algorithmName(config_->algorithm) << " (" << runner.workerCount() << " workers)";

        auto result = runner.run(reference, reference_column, queries, column);
        if (!result.succeeded)
        {
            PLOG_ERROR << "Matching " << file << "/" << column << " failed in stage " << result.stage_name << ": "
                       << result.error.value_or("unknown error");
            continue;
        }

        try
        {
            store.exportForValidation(result.result, file, reference_column);
            any = true;
        }
        catch (const std::exception& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Export, "Validation export failed",
                                              file + "/" + column + ": " + ex.what());
        }
    }
    return any;
}

int Application::runEvaluate()
{
    PROFILE_SCOPE_FUNCTION();

    std::error_code ec;
    if (!std::filesystem::is_directory(config_->validation_dir, ec))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Input, "Validation directory not found",
                                          config_->validation_dir);
        return kExitFailure;
    }

    const data::ValidationStore store(config_->validation_dir, config_->output_dir);
    const evaluation::Evaluator evaluator(config_->evaluation_algorithms);
    const std::size_t exported = evaluator.run(store, config_->datasets);

    PLOG_INFO << "Evaluation finished: " << exported << "/" << config_->datasets.size() << " datasets written to "
              << config_->output_dir;
    return kExitSuccess;
}

void Application::printErrorSummary() const
{
    const std::size_t dropped = utils::ErrorReporter::DroppedCount();
    const auto reports = utils::ErrorReporter::GetPendingErrors();
    if (reports.empty())
        return;

    const utils::ErrorSummary summary = utils::ErrorReporter::Summarize(reports);
    std::cerr << "\n" << summary.warnings << " warning(s), " << summary.errors << " error(s), " << summary.fatal
              << " fatal";
    if (dropped > 0)
        std::cerr << " (" << dropped << " older report(s) not kept)";
    std::cerr << ":\n";

    std::size_t shown = 0;
    for (const auto& report : reports)
    {
        if (report.severity == utils::ErrorSeverity::Info)
            continue;
        if (++shown > kMaxSummaryLines)
        {
            std::cerr << "  ... see " << utils::LogManager::LogPath("reclink.log").string() << "\n";
            break;
        }
        std::cerr << "  [" << utils::ErrorReporter::SeverityToString(report.severity) << "/"
                  << utils::ErrorReporter::CategoryToString(report.category) << "] " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << ": " << report.technical_details;
        std::cerr << "\n";
    }
}
