#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// [logging] section of reclink.toml
struct LogSettings
{
    std::string directory = "logs";
    plog::Severity level = plog::info;
    bool append = true; // false truncates every log file at startup
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
};

/**
 * @brief Owns the plog appenders of the run.
 *
 * Instance 0 is the main log (console + reclink.log), instance 1 the matching
 * diagnostics log and instance 2 the profiling log when profiling is built in.
 *
 * Each instance is bound to one file per process. Shutdown() only silences the
 * loggers; registering the same instance again after a new Initialize() turns
 * it back on with the same file and fails for a different one.
 */
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filename; // relative to LogSettings::directory
        std::optional<plog::Severity> level_override;
        bool add_console_appender = false;
    };

    static bool Initialize(const LogSettings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static const LogSettings& Settings();
    static std::filesystem::path LogPath(const std::string& filename);

private:
    LogManager() = default;

    static bool s_initialized;
    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::map<int, std::string> s_bound_paths; // instance -> log file
};

} // namespace utils
