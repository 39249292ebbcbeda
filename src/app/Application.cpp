#include "Application.hpp"

#include "config/ConfigManager.hpp"
#include "savescan/api/savescan.hpp"
#include "savescan/api/telemetry_json.hpp"
#include "savescan/events/TelemetryEvents.hpp"
#include "savescan/snapshot/FileSnapshotProvider.hpp"
#include "savescan/util/Profile.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#ifndef SAVESCAN_VERSION
#define SAVESCAN_VERSION "0.1.0"
#endif

namespace
{
const char* ExtractStatusName(savescan::ExtractStatus status)
{
    switch (status)
    {
    case savescan::ExtractStatus::Ok:
        return "ok";
    case savescan::ExtractStatus::LayoutNotFound:
        return "layout not found";
    case savescan::ExtractStatus::CaptureFailed:
        return "capture failed";
    default:
        return "unknown";
    }
}
} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    if (auto error = parseCommandLineArgs())
    {
        std::cerr << "savescan: " << *error << "\n\n";
        printUsage(std::cerr);
        return kExitFailure;
    }

    if (options_.show_help)
    {
        printUsage(std::cout);
        return kExitOk;
    }

    if (options_.show_version)
    {
        std::cout << "savescan " << SAVESCAN_VERSION << '\n';
        return kExitOk;
    }

    if (!initializeLogging())
        return kExitFailure;

    initializeConfig();
    initializeEngine();

    int exit_code = kExitFailure;
    try
    {
        exit_code = extractAndPrint();
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Unknown, "Extraction aborted", ex.what());
    }

    // Problems go to stderr so stdout stays a single JSON document
    utils::ErrorReporter::WriteSummary(std::cerr, options_.verbose ? utils::ErrorSeverity::Info :
                                                                     utils::ErrorSeverity::Warning);
    return exit_code;
}

std::optional<std::string> Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            options_.show_help = true;
        }
        else if (std::strcmp(arg, "--version") == 0)
        {
            options_.show_version = true;
        }
        else if (std::strcmp(arg, "--pretty") == 0)
        {
            options_.pretty = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0)
        {
            options_.verbose = true;
        }
        else if (std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "--previous") == 0)
        {
            if (i + 1 >= argc_)
                return std::string(arg) + " needs a path";

            if (std::strcmp(arg, "--config") == 0)
                options_.config_path = argv_[++i];
            else
                options_.previous_path = std::string(argv_[++i]);
        }
        else if (arg[0] == '-' && arg[1] != '\0')
        {
            return std::string("unknown option ") + arg;
        }
        else if (options_.state_path.empty())
        {
            options_.state_path = arg;
        }
        else
        {
            return std::string("unexpected argument ") + arg;
        }
    }

    if (options_.state_path.empty() && !options_.show_help && !options_.show_version)
        return std::string("missing STATE file");

    return std::nullopt;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    if (!utils::LogManager::Initialize(options_.config_path))
    {
        std::cerr << "savescan: failed to initialize logging\n";
        return false;
    }

    utils::LogManager::LoggerConfig logger_config;
    logger_config.name = "main";
    if (options_.verbose)
        logger_config.level_override = plog::debug;

    if (!utils::LogManager::RegisterLogger<0>(logger_config))
    {
        std::cerr << "savescan: cannot open log file " << utils::LogManager::GetLogFile() << '\n';
        return false;
    }

    PLOG_INFO << "savescan " << SAVESCAN_VERSION << " starting";
    return true;
}

void Application::initializeConfig()
{
    PROFILE_SCOPE_FUNCTION();

    config_ = std::make_unique<ConfigManager>(options_.config_path);
    if (!engine_settings_.registerWith(*config_))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Engine settings not registered",
                                          config_->lastError());
    }

    if (!config_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            config_->lastError());
    }

    if (options_.verbose)
        engine_settings_.verbose = true;
}

void Application::initializeEngine()
{
    engine_ = std::make_unique<savescan::Engine>();
    engine_->set_error_callback(
        [](const savescan::ErrorInfo& err)
        {
            switch (err.level)
            {
            case savescan::ErrorSeverityLevel::Error:
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Snapshot, err.message, err.details);
                break;
            case savescan::ErrorSeverityLevel::Warning:
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Snapshot, err.message, err.details);
                break;
            case savescan::ErrorSeverityLevel::Info:
                utils::ErrorReporter::ReportInfo(utils::ErrorCategory::Snapshot, err.message, err.details);
                break;
            }
        });
    if (!engine_->initialize(engine_settings_.toEngineConfig(), utils::LogManager::MakeEngineLogger()))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "Engine rejected configuration, using defaults");
    }
}

std::optional<savescan::ExtractionResult> Application::captureFile(const std::string& path)
{
    savescan::FileSnapshotProvider provider(path);
    auto result = engine_->capture_and_extract(provider);
    if (result.status == savescan::ExtractStatus::CaptureFailed)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Snapshot, "Cannot read save state",
                                          provider.last_error());
        return std::nullopt;
    }

    PLOG_INFO << path << ": " << ExtractStatusName(result.status) << (result.from_cache ? " (cached layout)" : "");
    return result;
}

int Application::extractAndPrint()
{
    PROFILE_SCOPE_FUNCTION();

    std::optional<savescan::ExtractionResult> previous;
    if (options_.previous_path)
    {
        previous = captureFile(*options_.previous_path);
        if (!previous)
            return kExitFailure;
    }

    auto current = captureFile(options_.state_path);
    if (!current)
        return kExitFailure;

    std::vector<savescan::GameEvent> events;
    if (previous && !previous->ok())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Decoding,
                                            "No events: previous save state has no usable layout",
                                            *options_.previous_path);
    }
    else if (previous && current->ok())
    {
        events = savescan::TelemetryEvents::Diff(previous->telemetry, current->telemetry);
        PLOG_DEBUG << events.size() << " event(s) since " << *options_.previous_path;
    }

    auto payload = savescan::BuildPayload(current->telemetry, events, utcTimestamp());
    std::cout << payload.dump(options_.pretty ? 2 : -1) << '\n';

    return current->ok() ? kExitOk : kExitLayoutNotFound;
}

void Application::printUsage(std::ostream& out)
{
    out << "Usage: savescan [options] STATE\n"
           "\n"
           "Extract game telemetry from an emulator save state and print it as JSON.\n"
           "\n"
           "Options:\n"
           "  --config PATH     configuration file (default: savescan.toml)\n"
           "  --previous STATE  earlier save state; emit the events between the two\n"
           "  --pretty          indent the JSON output\n"
           "  -v, --verbose     debug logging\n"
           "  --version         print the version and exit\n"
           "  -h, --help        print this help and exit\n"
           "\n"
           "Exit status: 0 on success, 2 if no memory layout was found, 1 on other errors.\n";
}

std::string Application::utcTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}
