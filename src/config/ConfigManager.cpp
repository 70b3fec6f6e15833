#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace config
{

ConfigManager::ConfigManager(std::string config_path) : config_path_(std::move(config_path)) {}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        auto clash = std::find_first_of(ownedKeys.begin(), ownedKeys.end(), handler.ownedKeys.begin(),
                                        handler.ownedKeys.end());
        if (clash != ownedKeys.end())
        {
            last_error_ = "key '" + *clash + "' of section '" + path + "' is already owned";
            PLOG_ERROR << "Config handler rejected: " << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::ifstream in(config_path_, std::ios::binary);
    file_found_ = static_cast<bool>(in);
    if (!file_found_)
    {
        PLOG_INFO << "No configuration at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        unknown_keys_.clear();
        dispatch();
        return true;
    }

    std::ostringstream text;
    text << in.rdbuf();
    return parse(text.str(), config_path_);
}

bool ConfigManager::loadFromString(std::string_view document)
{
    last_error_.clear();
    return parse(document, "<string>");
}

bool ConfigManager::parse(std::string_view document, const std::string& source)
{
    bool parsed = true;
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(document, source));
    }
    catch (const toml::parse_error& pe)
    {
        parsed = false;
        const auto& where = pe.source().begin;
        last_error_ = "config parse error in " + source + " at " + std::to_string(where.line) + ":" +
                      std::to_string(where.column) + ": " + std::string(pe.description());
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration not readable, using defaults", last_error_);
        root_ = std::make_unique<toml::table>();
    }

    collectUnknownKeys();
    dispatch();
    return parsed;
}

void ConfigManager::dispatch()
{
    static const toml::table kEmpty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(handler.path);
        handler.callbacks.load(section ? *section : kEmpty);
    }
}

bool ConfigManager::isKnownKey(const std::string& path, const std::string& key) const
{
    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            if (handler.ownedKeys.empty())
                return true;
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
                return true;
        }

        // A registered section is a known key of its parent
        const std::string child = path.empty() ? key : path + "." + key;
        if (handler.path == child || handler.path.rfind(child + ".", 0) == 0)
            return true;
    }
    return false;
}

void ConfigManager::collectUnknownKeys()
{
    unknown_keys_.clear();

    std::vector<std::string> paths{ "" };
    for (const auto& handler : handlers_)
    {
        if (std::find(paths.begin(), paths.end(), handler.path) == paths.end())
            paths.push_back(handler.path);
    }

    for (const auto& path : paths)
    {
        const toml::table* section = resolveTablePath(path);
        if (!section)
            continue;

        for (const auto& entry : *section)
        {
            const std::string name(entry.first.str());
            if (isKnownKey(path, name))
                continue;

            const std::string dotted = path.empty() ? name : path + "." + name;
            unknown_keys_.push_back(dotted);
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Unknown configuration key",
                                                dotted + " in " + config_path_);
        }
    }
}

const toml::table& ConfigManager::root() const
{
    static const toml::table kEmpty;
    return root_ ? *root_ : kEmpty;
}

const toml::table* ConfigManager::resolveTablePath(const std::string& path) const
{
    if (!root_)
        return nullptr;
    if (path.empty())
        return root_.get();

    const toml::table* current = root_.get();
    std::istringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '.'))
    {
        const toml::node* child = current->get(segment);
        current = child ? child->as_table() : nullptr;
        if (!current)
            return nullptr;
    }
    return current;
}

} // namespace config
