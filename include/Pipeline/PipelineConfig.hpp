#pragma once

#include <string>
#include <vector>
#include <iostream>
#include <boost/serialization/access.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/version.hpp>

#include "helper.hpp"

enum class AssemblerEngine
{
    Megahit,
    Skesa,
    Spades
};

enum class ErrorPolicy
{
    Continue,
    Halt
};

std::string assembler_name(AssemblerEngine engine);
AssemblerEngine parse_assembler(const std::string& value);
std::string error_policy_name(ErrorPolicy policy);
ErrorPolicy parse_error_policy(const std::string& value);

/** @brief all parameters of a run, loaded from a KEY=value ini file
 * @details the config is part of every checkpoint and read-only while stages run.
 * Optional values are empty strings.
**/
struct PipelineConfig
{
    // REQUIRED ARGUMENTS
    std::string barcodes;
    std::string output;

    // INPUT FILES (one entry per replicate)
    std::vector<std::string> forward;
    std::vector<std::string> reverse;
    std::string tagForward;
    std::string tagReverse;
    std::string primerForward;
    std::string primerReverse;

    // EXTERNAL TOOLS
    AssemblerEngine assembler = AssemblerEngine::Megahit;
    std::string megahitParams = "--keep-tmp-files";
    std::string skesaParams = "--use_paired_ends";
    std::string spadesParams = "";
    std::string fastpParams = "-3 -q 30 -n 5 -A";
    std::string blastParams = "";
    std::string cutadaptExe = "cutadapt";
    std::string fastpExe = "fastp";
    std::string megahitExe = "megahit";
    std::string skesaExe = "skesa";
    std::string spadesExe = "spades.py";
    std::string blastnExe = "blastn";

    // RUN
    int threads = 5;
    std::string prefix = "platecall";
    ErrorPolicy onError = ErrorPolicy::Continue;
    std::string reportFilter = "";
    std::string datetimeFormat = "%Y_%m%d_%H%M";
    std::string logLevel = "INFO";
    std::string logFile = "";

    void write(std::ostream& os = std::cout) const;

    //throws ConfigError naming the missing/invalid parameters
    void validate() const;

    private:
        friend class boost::serialization::access;
        template<class Archive>
        void serialize(Archive& ar, const unsigned int /*version*/)
        {
            ar & barcodes & output;
            ar & forward & reverse;
            ar & tagForward & tagReverse & primerForward & primerReverse;
            ar & assembler;
            ar & megahitParams & skesaParams & spadesParams & fastpParams & blastParams;
            ar & cutadaptExe & fastpExe & megahitExe & skesaExe & spadesExe & blastnExe;
            ar & threads & prefix & onError & reportFilter & datetimeFormat & logLevel & logFile;
        }
};
BOOST_CLASS_VERSION(PipelineConfig, 1)

/**
 * @brief sets a single key (case-insensitive) of the config
 * @return false for unknown keys, invalid values throw a ConfigError
**/
bool set_config_value(PipelineConfig& cfg, const std::string& key, const std::string& value);

// parse the ini file, a missing file is a FatalInputError. Inputs can still be added
// from the command line, so the result is checked by validate() afterwards
PipelineConfig load_config_from_file(const std::string& path);

/**
 * @brief overlays every key named in an override ini file onto an existing config
 * @return the upper-case keys that were replaced, all other values stay untouched
**/
std::vector<std::string> apply_override_file(PipelineConfig& cfg, const std::string& path);
