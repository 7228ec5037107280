#include "RunLog.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>

LogLevel parse_log_level(const std::string& value)
{
    std::string v = to_upper(trim(value));
    if(v == "DEBUG") return LogLevel::Debug;
    if(v == "INFO") return LogLevel::Info;
    if(v == "WARNING") return LogLevel::Warning;
    if(v == "ERROR") return LogLevel::Error;
    throw ConfigError("Unknown log level '" + value + "' (use DEBUG, INFO, WARNING or ERROR)");
}

std::string log_level_name(LogLevel level)
{
    switch(level)
    {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

RunLog::RunLog(LogLevel level, const std::string& logFile, std::ostream& out, std::ostream& err)
: level(level), out(out), err(err)
{
    if(!logFile.empty())
    {
        std::filesystem::path logPath(logFile);
        if(logPath.has_parent_path()){std::filesystem::create_directories(logPath.parent_path());}
        file.open(logFile, std::ios::app);
        if(!file)
        {
            throw ConfigError("Could not open log file: " + logFile);
        }
    }
}

void RunLog::log(LogLevel messageLevel, const std::string& stage, const std::string& message)
{
    if(messageLevel < level)
    {
        return;
    }

    std::lock_guard<std::mutex> guard(logMutex);
    std::time_t now = std::time(nullptr);
    std::ostringstream line;
    line << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S") << ' '
         << log_level_name(messageLevel) << '(' << (stage.empty() ? "platecall" : stage) << "): " << message << '\n';

    std::ostream& console = messageLevel >= LogLevel::Warning ? err : out;
    console << line.str() << std::flush;
    if(file.is_open())
    {
        file << line.str() << std::flush;
    }
}

void RunLog::progress(unsigned long long done, unsigned long long total)
{
    if(total == 0 || level > LogLevel::Info)
    {
        return;
    }
    std::lock_guard<std::mutex> guard(logMutex);
    printProgress(static_cast<double>(done) / static_cast<double>(total), out);
    if(done >= total)
    {
        out << "\n";
    }
}
