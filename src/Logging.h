/******************************************************************************
 * @brief Logging for the GranuleCounter pipeline.
 *
 *        Note: The loggers are defined in Logging.cpp. Every module includes
 *              this header and logs through logging::g_qSharedLogger.
 *
 * @file Logging.h
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-08-22
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GRANCOUNT_LOGGING_H
#define GRANCOUNT_LOGGING_H

/// \cond
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include "quill/backend/PatternFormatter.h"
#include "quill/core/Filesystem.h"
#include "quill/core/LogLevel.h"
#include "quill/core/PatternFormatterOptions.h"

#include "quill/sinks/ConsoleSink.h"
#include "quill/sinks/RotatingFileSink.h"

#include <atomic>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// \endcond

#include "./Constants.h"
#include "./util/TimeOperations.hpp"

/******************************************************************************
 * @brief Logging Levels:
 *
 *        Priority > Level     > Description
 *        Level 1  > TRACE_L3  > Unused
 *        Level 2  > TRACE_L2  > Unused
 *        Level 3  > TRACE_L1  > Per candidate window of the boundary search, Otsu thresholds
 *        Level 4  > DEBUG     > Per image results (component count, best window, wide estimate)
 *        Level 5  > INFO      > Stage summaries, dataset sizes, artifact paths
 *        Level 6  > NOTICE    > Final results the user asked for (counts, evaluation)
 *        Level 7  > WARNING   > A row or image was skipped, the batch continues.
 *        Level 8  > ERROR     > A row or image could not be processed at all.
 *        Level 9  > CRITICAL  > The pipeline cannot continue and exits after the message is sent.
 *
 *        The console shows INFO and up unless GRANCOUNT_LOG_LEVEL names another
 *        level. The run's .log and .csv files keep everything.
 *
 *
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-08-22
 ******************************************************************************/
namespace logging
{
    /////////////////////////////////////////
    // Declare namespace external variables and objects.
    /////////////////////////////////////////

    extern quill::Logger* g_qFileLogger;
    extern quill::Logger* g_qConsoleLogger;
    extern quill::Logger* g_qSharedLogger;

    extern std::atomic<quill::LogLevel> g_eConsoleLogLevel;
    extern std::atomic<quill::LogLevel> g_eFileLogLevel;

    extern std::string g_szProgramStartTimeString;
    extern std::string g_szLoggingOutputPath;

    /////////////////////////////////////////
    // Declare namespace methods.
    /////////////////////////////////////////

    void InitializeLoggers(const std::string& szLoggingOutputPath, const std::string& szRunDirectory = timeops::GetTimestamp());
    void ShutdownLoggers();
    std::optional<quill::LogLevel> ParseLogLevel(const std::string& szLevel);

    /******************************************************************************
     * @brief A quill sink that formats every message with its own pattern and
     *      drops anything under a runtime level owned by this namespace. The gate
     *      lives in the sink, so the shared logger can feed the console and the
     *      files at different levels.
     *
     * @tparam BaseSink - quill::ConsoleSink or quill::RotatingFileSink.
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-08-16
     ******************************************************************************/
    template<typename BaseSink>
    class LevelGatedSink : public BaseSink
    {
        public:
            /******************************************************************************
             * @brief Construct a sink that takes no file name.
             *
             * @param pLevelGate - Level a message must reach to be written. Must outlive the sink.
             * @param qFormatOptions - Pattern and timestamp format of every line.
             * @param tArgs - Forwarded to the BaseSink constructor.
             ******************************************************************************/
            template<typename... tBaseArgs>
            LevelGatedSink(const std::atomic<quill::LogLevel>* pLevelGate, const quill::PatternFormatterOptions& qFormatOptions, tBaseArgs&&... tArgs) :
                BaseSink(std::forward<tBaseArgs>(tArgs)...), m_pLevelGate(pLevelGate), m_qFormatter(qFormatOptions)
            {}

            /******************************************************************************
             * @brief Construct a file sink. quill passes the sink name, which is the file
             *      path, as the first argument.
             *
             * @param qFilename - File the sink writes.
             * @param pLevelGate - Level a message must reach to be written. Must outlive the sink.
             * @param qFormatOptions - Pattern and timestamp format of every line.
             * @param tArgs - Forwarded to the BaseSink constructor after the file name.
             ******************************************************************************/
            template<typename... tBaseArgs>
            LevelGatedSink(const quill::fs::path& qFilename,
                           const std::atomic<quill::LogLevel>* pLevelGate,
                           const quill::PatternFormatterOptions& qFormatOptions,
                           tBaseArgs&&... tArgs) :
                BaseSink(qFilename, std::forward<tBaseArgs>(tArgs)...), m_pLevelGate(pLevelGate), m_qFormatter(qFormatOptions)
            {}

            /******************************************************************************
             * @brief Called by the quill backend thread for every message routed here.
             ******************************************************************************/
            void write_log(const quill::MacroMetadata* qLogMetadata,
                           uint64_t unLogTimestamp,
                           std::string_view szThreadID,
                           std::string_view szThreadName,
                           const std::string& szProcessID,
                           std::string_view szLoggerName,
                           quill::LogLevel qLogLevel,
                           std::string_view szLogLevelDescription,
                           std::string_view szLogLevelShortCode,
                           const std::vector<std::pair<std::string, std::string>>* vNamedArgs,
                           std::string_view szLogMessage,
                           std::string_view) override
            {
                if (qLogLevel < m_pLevelGate->load(std::memory_order_relaxed))
                {
                    return;
                }

                std::string_view szLine = m_qFormatter.format(unLogTimestamp,
                                                              szThreadID,
                                                              szThreadName,
                                                              szProcessID,
                                                              szLoggerName,
                                                              szLogLevelDescription,
                                                              szLogLevelShortCode,
                                                              *qLogMetadata,
                                                              vNamedArgs,
                                                              szLogMessage);

                BaseSink::write_log(qLogMetadata,
                                    unLogTimestamp,
                                    szThreadID,
                                    szThreadName,
                                    szProcessID,
                                    szLoggerName,
                                    qLogLevel,
                                    szLogLevelDescription,
                                    szLogLevelShortCode,
                                    vNamedArgs,
                                    szLogMessage,
                                    szLine);
            }

        private:
            const std::atomic<quill::LogLevel>* m_pLevelGate;
            quill::PatternFormatter m_qFormatter;
    };

    using CounterConsoleSink      = LevelGatedSink<quill::ConsoleSink>;
    using CounterRotatingFileSink = LevelGatedSink<quill::RotatingFileSink>;
}    // namespace logging
#endif    // GRANCOUNT_LOGGING_H
