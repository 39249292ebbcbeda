#pragma once

#include <string>
#include <memory>
#include <functional>
#include <map>
#include <set>
#include <vector>

#include <toml++/toml.h>

// A settings group owns a set of keys under one dotted table path
struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "savescan.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Missing file is not an error: every group receives an empty table
    bool load();
    // Writes owned keys, keeps everything else from the last load
    bool save();
    const toml::table& root() const;

    const std::string& configPath() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    struct Owner
    {
        TableCallbacks callbacks;
        std::set<std::string> keys;
    };

    static std::vector<std::string> splitPath(const std::string& path);
    static const toml::table* findSection(const toml::table& root, const std::string& path);
    toml::table* ensureSection(toml::table& root, const std::string& path);

    void dispatchLoad();
    bool writeAtomically(const toml::table& doc);
    void fail(const std::string& message, const std::string& details);

    std::string config_path_;
    std::string last_error_;
    std::map<std::string, std::vector<Owner>> owners_;
    std::unique_ptr<toml::table> root_;
};
