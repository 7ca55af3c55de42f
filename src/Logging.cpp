/******************************************************************************
 * @brief Sets up the loggers and sinks used by the GranuleCounter pipeline.
 *
 * @file Logging.cpp
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-10-18
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "Logging.h"

/// \cond
#include "quill/core/QuillError.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

/// \endcond

namespace logging
{
    /////////////////////////////////////////
    // Forward declarations for namespace variables and objects.
    /////////////////////////////////////////
    quill::Logger* g_qFileLogger    = nullptr;
    quill::Logger* g_qConsoleLogger = nullptr;
    quill::Logger* g_qSharedLogger  = nullptr;

    std::atomic<quill::LogLevel> g_eConsoleLogLevel(quill::LogLevel::Info);
    std::atomic<quill::LogLevel> g_eFileLogLevel(quill::LogLevel::TraceL3);

    std::string g_szProgramStartTimeString;
    std::string g_szLoggingOutputPath;

    /******************************************************************************
     * @brief Level colours of the console sink.
     *
     * @return quill::ConsoleSinkConfig::Colours - quill's defaults with ours on top.
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-08-16
     ******************************************************************************/
    static quill::ConsoleSinkConfig::Colours BuildConsoleColours()
    {
        quill::ConsoleSinkConfig::Colours qColors;
        qColors.apply_default_colours();

        const std::pair<quill::LogLevel, const std::string*> aLevelColours[] = {
            {quill::LogLevel::TraceL3,   &constants::szTraceL3Color},
            {quill::LogLevel::TraceL2,   &constants::szTraceL2Color},
            {quill::LogLevel::TraceL1,   &constants::szTraceL1Color},
            {quill::LogLevel::Debug,     &constants::szDebugColor},
            {quill::LogLevel::Info,      &constants::szInfoColor},
            {quill::LogLevel::Notice,    &constants::szNoticeColor},
            {quill::LogLevel::Warning,   &constants::szWarningColor},
            {quill::LogLevel::Error,     &constants::szErrorColor},
            {quill::LogLevel::Critical,  &constants::szCriticalColor},
            {quill::LogLevel::Backtrace, &constants::szBacktraceColor}
        };
        for (const auto& stLevelColour : aLevelColours)
        {
            qColors.assign_colour_to_log_level(stLevelColour.first, *stLevelColour.second);
        }

        return qColors;
    }

    /******************************************************************************
     * @brief Rotation settings shared by the .log and .csv sinks of a run.
     *
     * @return quill::RotatingFileSinkConfig - Append mode with size based rotation.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-10-18
     ******************************************************************************/
    static quill::RotatingFileSinkConfig BuildRotatingFileConfig()
    {
        quill::RotatingFileSinkConfig qConfig;
        qConfig.set_open_mode('a');
        qConfig.set_rotation_max_file_size(constants::LOGGING_FILE_ROTATION_BYTES);
        qConfig.set_max_backup_files(constants::LOGGING_FILE_MAX_BACKUPS);

        return qConfig;
    }

    /******************************************************************************
     * @brief Map a level name such as "debug" or "TRACE_L1" to its quill level.
     *
     * @param szLevel - Level name, case insensitive.
     * @return std::optional<quill::LogLevel> - The level, or nullopt if the name is unknown.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-10-18
     ******************************************************************************/
    std::optional<quill::LogLevel> ParseLogLevel(const std::string& szLevel)
    {
        std::string szLower = szLevel;
        std::transform(szLower.begin(), szLower.end(), szLower.begin(), [](unsigned char chValue) { return static_cast<char>(std::tolower(chValue)); });

        try
        {
            return quill::loglevel_from_string(szLower);
        }
        catch (const quill::QuillError&)
        {
            return std::nullopt;
        }
    }

    /******************************************************************************
     * @brief Logger Initializer - Creates the run directory, the sinks and the three
     *        loggers, then starts the quill backend. Must run before any module logs.
     *
     * @param szLoggingOutputPath - Directory that holds one sub directory per run.
     * @param szRunDirectory - Name of this run's sub directory.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-08-22
     ******************************************************************************/
    void InitializeLoggers(const std::string& szLoggingOutputPath, const std::string& szRunDirectory)
    {
        g_szProgramStartTimeString = szRunDirectory;

        // <output>/<run>/console_output.{log,csv}
        std::filesystem::path pathRun = std::filesystem::path(szLoggingOutputPath) / szRunDirectory;
        g_szLoggingOutputPath         = pathRun.string();

        std::error_code errCode;
        std::filesystem::create_directories(pathRun, errCode);
        if (errCode)
        {
            // The logger isn't up yet.
            std::cerr << "Unable to create the logging output directory: " << pathRun.string() << " (" << errCode.message() << ")" << std::endl;
        }
        std::filesystem::path pathLogFile = pathRun / "console_output.log";
        std::filesystem::path pathCsvFile = pathRun / "console_output.csv";

        // Line formats.
        const std::string szTimestampPattern = "%Y-%m-%d %H:%M:%S.%Qms";
        quill::PatternFormatterOptions qLogFormat("%(time) %(log_level) [%(thread_id)] [%(file_name):%(line_number)] %(message)", szTimestampPattern);
        quill::PatternFormatterOptions qCsvFormat("%(time),\t%(log_level),\t[%(thread_id)],\t[%(file_name):%(line_number)],\t\"%(message)\"", szTimestampPattern);
        quill::PatternFormatterOptions qConsoleFormat("%(time) %(log_level:9) [%(file_name):%(line_number)] %(message)", szTimestampPattern);

        quill::ConsoleSinkConfig qConsoleConfig;
        qConsoleConfig.set_colours(BuildConsoleColours());
        qConsoleConfig.set_colour_mode(quill::ConsoleSinkConfig::ColourMode::Automatic);
        qConsoleConfig.set_override_pattern_formatter_options(qConsoleFormat);

        // Create Sinks
        std::shared_ptr<quill::Sink> qLogFileSink =
            quill::Frontend::create_or_get_sink<CounterRotatingFileSink>(pathLogFile.string(), &g_eFileLogLevel, qLogFormat, BuildRotatingFileConfig());
        std::shared_ptr<quill::Sink> qCsvFileSink =
            quill::Frontend::create_or_get_sink<CounterRotatingFileSink>(pathCsvFile.string(), &g_eFileLogLevel, qCsvFormat, BuildRotatingFileConfig());
        std::shared_ptr<quill::Sink> qConsoleSink =
            quill::Frontend::create_or_get_sink<CounterConsoleSink>("GranuleCounterConsole", &g_eConsoleLogLevel, qConsoleFormat, qConsoleConfig);

        // Sink gates are final before the backend thread starts reading them.
        g_eFileLogLevel.store(constants::FILE_DEFAULT_LEVEL);
        g_eConsoleLogLevel.store(constants::CONSOLE_DEFAULT_LEVEL);

        // Console level override.
        const char* szOverride = std::getenv(constants::LOGGING_LEVEL_ENVIRONMENT_VARIABLE.c_str());
        std::optional<quill::LogLevel> eOverride;
        if (szOverride != nullptr)
        {
            eOverride = ParseLogLevel(szOverride);
            if (eOverride.has_value())
            {
                g_eConsoleLogLevel.store(eOverride.value());
            }
        }

        // Start Quill
        quill::BackendOptions qBackendConfig;
        quill::Backend::start(qBackendConfig);

        // Create Loggers
        g_qFileLogger    = quill::Frontend::create_or_get_logger("FILE_LOGGER", {qLogFileSink, qCsvFileSink});
        g_qConsoleLogger = quill::Frontend::create_or_get_logger("CONSOLE_LOGGER", {qConsoleSink});
        g_qSharedLogger  = quill::Frontend::create_or_get_logger("SHARED_LOGGER", {qLogFileSink, qCsvFileSink, qConsoleSink});

        // The sinks gate at runtime, the loggers only cut what no sink would ever write.
        g_qFileLogger->set_log_level(constants::FILE_MIN_LEVEL);
        g_qConsoleLogger->set_log_level(constants::CONSOLE_MIN_LEVEL);
        g_qSharedLogger->set_log_level(std::min(constants::FILE_MIN_LEVEL, constants::CONSOLE_MIN_LEVEL));

        for (quill::Logger* qLogger : {g_qFileLogger, g_qConsoleLogger, g_qSharedLogger})
        {
            qLogger->init_backtrace(constants::LOGGING_BACKTRACE_DEPTH, quill::LogLevel::Critical);
        }

        if (szOverride != nullptr && !eOverride.has_value())
        {
            // Submit logger message.
            LOG_WARNING(g_qSharedLogger, "Ignoring {}={}, not a log level.", constants::LOGGING_LEVEL_ENVIRONMENT_VARIABLE, szOverride);
        }

        // Submit logger message.
        LOG_DEBUG(g_qSharedLogger, "Logging run {} to {}.", szRunDirectory, g_szLoggingOutputPath);
    }

    /******************************************************************************
     * @brief Flushes every pending message and stops the quill backend. The batch
     *      driver calls this right before returning so nothing queued is lost.
     *
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-10-18
     ******************************************************************************/
    void ShutdownLoggers()
    {
        // The shared logger feeds every sink.
        if (g_qSharedLogger != nullptr)
        {
            g_qSharedLogger->flush_log();
        }

        quill::Backend::stop();
    }
}    // namespace logging
