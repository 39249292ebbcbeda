#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , root_(std::make_unique<toml::table>())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    if (splitPath(path).empty())
    {
        last_error_ = "Invalid table path '" + path + "'";
        PLOG_ERROR << last_error_;
        return false;
    }

    auto& group = owners_[path];
    for (const auto& key : ownedKeys)
    {
        for (const auto& owner : group)
        {
            if (owner.keys.count(key))
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    group.push_back({std::move(cb), std::set<std::string>(ownedKeys.begin(), ownedKeys.end())});
    PLOG_DEBUG << "Registered config table [" << path << "] with " << ownedKeys.size() << " keys";
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::error_code ec;
    if (!fs::exists(config_path_, ec))
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse_file(config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        const auto line = pe.source().begin.line;
        std::string details = std::string(pe.description());
        if (line > 0)
            details = "Error at line " + std::to_string(line) + ": " + details;

        last_error_ = "config parse error: " + std::string(pe.description());
        PLOG_WARNING << last_error_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            details + "\nFile: " + config_path_);
        return false;
    }

    dispatchLoad();
    PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

void ConfigManager::dispatchLoad()
{
    static const toml::table empty;
    for (const auto& entry : owners_)
    {
        const toml::table* section = findSection(*root_, entry.first);
        for (const auto& owner : entry.second)
            owner.callbacks.load(section ? *section : empty);
    }
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table doc = *root_;
    for (const auto& entry : owners_)
    {
        toml::table* target = ensureSection(doc, entry.first);
        if (!target)
        {
            fail("Cannot write table '" + entry.first + "'", "A non-table value occupies the path");
            return false;
        }

        for (const auto& owner : entry.second)
        {
            toml::table produced = owner.callbacks.save();
            for (const auto& key : owner.keys)
            {
                if (produced.contains(key))
                    target->insert_or_assign(key, produced[key]);
                else
                    target->erase(key);
            }
            for (const auto& kv : produced)
            {
                if (!owner.keys.count(std::string(kv.first.str())))
                    PLOG_WARNING << "Ignoring unowned key '" << kv.first.str() << "' from [" << entry.first << "]";
            }
        }
    }

    if (!writeAtomically(doc))
        return false;

    *root_ = std::move(doc);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

bool ConfigManager::writeAtomically(const toml::table& doc)
{
    const fs::path target(config_path_);
    fs::path staging = target;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            fail("Failed to open temp file for writing", "Could not create " + staging.string());
            return false;
        }
        out << doc << '\n';
        if (!out.flush())
        {
            fail("Failed to write temp file", staging.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec)
    {
        fs::remove(staging, ec);
        fail("Failed to rename temp file", ec.message());
        return false;
    }
    return true;
}

void ConfigManager::fail(const std::string& message, const std::string& details)
{
    last_error_ = message;
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                      message + ": " + details);
}

const toml::table& ConfigManager::root() const
{
    return *root_;
}

std::vector<std::string> ConfigManager::splitPath(const std::string& path)
{
    std::vector<std::string> segments;
    std::string::size_type start = 0;
    while (start <= path.size())
    {
        auto dot = path.find('.', start);
        if (dot == std::string::npos)
            dot = path.size();
        if (dot == start)
            return {};
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

const toml::table* ConfigManager::findSection(const toml::table& root, const std::string& path)
{
    const toml::table* current = &root;
    for (const auto& segment : splitPath(path))
    {
        current = current->get_as<toml::table>(segment);
        if (!current)
            return nullptr;
    }
    return current;
}

toml::table* ConfigManager::ensureSection(toml::table& root, const std::string& path)
{
    toml::table* current = &root;
    for (const auto& segment : splitPath(path))
    {
        auto inserted = current->emplace<toml::table>(segment);
        current = inserted.first->second.as_table();
        if (!current)
        {
            PLOG_WARNING << "Config key '" << segment << "' in [" << path << "] is not a table";
            return nullptr;
        }
    }
    return current;
}
