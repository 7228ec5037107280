#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>

#include "helper.hpp"

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

//DEBUG, INFO, WARNING or ERROR (case-insensitive), anything else is a ConfigError
LogLevel parse_log_level(const std::string& value);
std::string log_level_name(LogLevel level);

/** @brief the log of one run: timestamped "LEVEL(stage): message" lines on the console and optionally in a file
 * @details the log is handed to every stage through the RunContext, worker threads of a stage share it.
 * Warnings and errors go to the error stream. It is never part of a checkpoint and is rebuilt on resume.
**/
class RunLog
{
    public:
        RunLog(LogLevel level = LogLevel::Info, const std::string& logFile = "",
               std::ostream& out = std::cout, std::ostream& err = std::cerr);
        RunLog(const RunLog&) = delete;
        RunLog& operator=(const RunLog&) = delete;

        void log(LogLevel messageLevel, const std::string& stage, const std::string& message);
        void debug(const std::string& stage, const std::string& message) { log(LogLevel::Debug, stage, message); }
        void info(const std::string& stage, const std::string& message) { log(LogLevel::Info, stage, message); }
        void warning(const std::string& stage, const std::string& message) { log(LogLevel::Warning, stage, message); }
        void error(const std::string& stage, const std::string& message) { log(LogLevel::Error, stage, message); }

        //progress bar of per-well work, only drawn on the console
        void progress(unsigned long long done, unsigned long long total);

        LogLevel get_level() const { return level; }

    private:
        std::mutex logMutex;
        LogLevel level;
        std::ofstream file;
        std::ostream& out;
        std::ostream& err;
};
