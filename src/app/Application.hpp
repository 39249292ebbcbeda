#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "config/EngineSettings.hpp"
#include "savescan/api/savescan.hpp"

class ConfigManager;

class Application
{
public:
    // Process exit codes
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitLayoutNotFound = 2;

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct Options
    {
        std::string config_path = "savescan.toml";
        std::string state_path;
        std::optional<std::string> previous_path;
        bool pretty = false;
        bool verbose = false;
        bool show_help = false;
        bool show_version = false;
    };

    // std::nullopt when the arguments are valid
    std::optional<std::string> parseCommandLineArgs();

    bool initializeLogging();
    void initializeConfig();
    void initializeEngine();

    // std::nullopt if the file could not be read
    std::optional<savescan::ExtractionResult> captureFile(const std::string& path);
    int extractAndPrint();

    static void printUsage(std::ostream& out);
    static std::string utcTimestamp();

    int argc_ = 0;
    char** argv_ = nullptr;

    Options options_;
    EngineSettings engine_settings_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<savescan::Engine> engine_;
};
