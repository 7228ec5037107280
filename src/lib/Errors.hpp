#pragma once

#include <stdexcept>
#include <string>

/// input that makes the whole run impossible: missing descriptors, corrupt or unequal fastq files
class FatalInputError : public std::runtime_error
{
    public:
        explicit FatalInputError(const std::string& message) : std::runtime_error(message) {}
};

/// invalid ini keys/values, override files or report filters
class ConfigError : public std::runtime_error
{
    public:
        explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/// failure of a single pipeline stage, the engine decides whether to continue
class StageError : public std::runtime_error
{
    public:
        explicit StageError(const std::string& message) : std::runtime_error(message) {}
};

/// non-zero exit of an external tool (cutadapt, fastp, assembler, blastn)
class ExternalToolError : public StageError
{
    public:
        ExternalToolError(const std::string& tool, int exitCode, const std::string& logFile)
        : StageError(tool + " returned " + std::to_string(exitCode) + " (see " + logFile + ")"),
          exitCode(exitCode)
        {}

        int exitCode;
};

/// unreadable checkpoint file on resume
class CheckpointError : public std::runtime_error
{
    public:
        explicit CheckpointError(const std::string& message) : std::runtime_error(message) {}
};
