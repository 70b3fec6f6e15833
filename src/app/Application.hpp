#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace config
{
class ConfigManager;
struct AppConfig;
} // namespace config

namespace data
{
class Table;
}

class Application
{
public:
    enum class Command
    {
        Match,
        Evaluate
    };

    struct Options
    {
        std::optional<Command> command;
        std::string config_path = "reclink.toml";
        std::optional<std::string> algorithm;
        std::optional<std::size_t> workers;
        bool verbose = false;
        bool debug = false;
        bool help = false;
        bool version = false;
        std::string error; // Non-empty on a usage error
    };

    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

    Application(int argc, char** argv);
    ~Application();

    int run();

    static Options ParseArguments(int argc, char** argv);
    static void PrintUsage(const char* program_name);
    static void PrintVersion();

private:
    bool initializeLogging();
    bool initializeConfig();
    void logConfiguration(bool config_ok) const;

    int runMatch();
    int runEvaluate();

    // Returns false when the query file could not be read
    bool runJob(const data::Table& reference, const data::Table& queries, const std::string& file,
                const std::vector<std::string>& columns);

    void printErrorSummary() const;

    Options options_;
    std::unique_ptr<config::ConfigManager> config_manager_;
    std::unique_ptr<config::AppConfig> config_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
