#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "processing/Diagnostics.hpp"

#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::map<int, std::string> LogManager::s_bound_paths;

bool LogManager::Initialize(const LogSettings& settings)
{
    if (s_initialized)
        return true;

    std::error_code ec;
    std::filesystem::create_directories(settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot create log directory",
                                   settings.directory + ": " + ec.message());
        return false;
    }

    s_settings = settings;
    s_initialized = true;
    return true;
}

template<int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before LogManager::Initialize",
                                   config.name);
        return false;
    }

    const std::string path = LogPath(config.filename).string();
    const plog::Severity level = config.level_override.value_or(s_settings.level);

    // plog loggers live for the whole process and cannot drop appenders, so a
    // logger registered before a Shutdown() is switched back on, not rebuilt.
    if (auto* existing = plog::get<InstanceId>())
    {
        const auto bound = s_bound_paths.find(InstanceId);
        if (bound != s_bound_paths.end() && bound->second != path)
        {
            ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger already bound to another file",
                                       config.name + ": " + bound->second + " (requested " + path + ")");
            return false;
        }
        existing->setMaxSeverity(level);
        return true;
    }

    try
    {
        if (!s_settings.append)
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), s_settings.max_file_size, static_cast<int>(s_settings.backup_count));
        plog::Logger<InstanceId>& logger = plog::init<InstanceId>(level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
        s_bound_paths[InstanceId] = path;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot open log file for " + config.name,
                                   path + ": " + ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);
#if RECLINK_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

namespace
{

template<int InstanceId>
void silence()
{
    if (auto* logger = plog::get<InstanceId>())
        logger->setMaxSeverity(plog::none);
}

} // namespace

void LogManager::Shutdown()
{
    // Loggers keep raw appender pointers, so the appenders stay alive until exit.
    silence<0>();
    silence<processing::Diagnostics::kLogInstance>();
#if RECLINK_PROFILING_LEVEL >= 1
    silence<profiling::kProfilingLogInstance>();
#endif
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

const LogSettings& LogManager::Settings() { return s_settings; }

std::filesystem::path LogManager::LogPath(const std::string& filename)
{
    return std::filesystem::path(s_settings.directory) / filename;
}

} // namespace utils
