#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

#include "savescan/api/logger.hpp"

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        std::optional<bool> console_override;
    };

    /**
     * @brief Read the [logging] table and prepare the log directory
     * @param config_path TOML file; a missing file keeps the defaults
     */
    static bool Initialize(const std::string& config_path = "savescan.toml");

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static bool IsConsoleEnabled();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& GetLogFile();
    static void PrepareLogDirectory(const std::string& filepath);

    /**
     * @brief Callbacks that forward savescan engine messages to plog instance 0
     */
    static savescan::Logger MakeEngineLogger();

private:
    LogManager() = default;

    static bool ReadConfig(const std::string& config_path);

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_console;
    static plog::Severity s_default_level;
    static std::string s_log_file;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
