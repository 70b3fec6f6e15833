#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

namespace config
{

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

/**
 * @brief Parses reclink.toml and hands each registered section to its loader.
 *
 * Sections are addressed by dotted path ("matching", "paths"); the empty path
 * is the document root. A missing section reaches its loader as an empty
 * table so loaders fall back to their defaults.
 *
 * The keys a handler owns double as the section's schema: after loading,
 * keys no handler owns are reported as Configuration warnings. A handler
 * registered with no keys accepts any key ([column_aliases]).
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "reclink.toml");
    ~ConfigManager();

    // False when one of ownedKeys is already owned at the same path
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error; a parse error keeps defaults and returns false.
    bool load();

    bool loadFromString(std::string_view document);

    const toml::table& root() const;
    const std::string& configPath() const { return config_path_; }
    bool fileFound() const { return file_found_; }
    const char* lastError() const { return last_error_.c_str(); }

    // Dotted keys of the last document that no handler owns
    const std::vector<std::string>& unknownKeys() const { return unknown_keys_; }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    bool parse(std::string_view document, const std::string& source);
    void dispatch();
    void collectUnknownKeys();
    bool isKnownKey(const std::string& path, const std::string& key) const;
    const toml::table* resolveTablePath(const std::string& path) const;

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;
    std::vector<HandlerEntry> handlers_;
    std::vector<std::string> unknown_keys_;
    std::unique_ptr<toml::table> root_;
};

} // namespace config
