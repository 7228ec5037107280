#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <boost/serialization/access.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/version.hpp>

#include "PipelineConfig.hpp"
#include "BarcodeTable.hpp"

/// input and output fastq files of one replicate for every preprocessing stage
struct ReplicatePaths
{
    std::string name;
    std::string rawForward;
    std::string rawReverse;
    std::string tagForward;
    std::string tagReverse;
    std::string primerForward;
    std::string primerReverse;
    std::string fastpForward;
    std::string fastpReverse;
    std::string fastpReport;

    private:
        friend class boost::serialization::access;
        template<class Archive>
        void serialize(Archive& ar, const unsigned int /*version*/)
        {
            ar & name & rawForward & rawReverse & tagForward & tagReverse;
            ar & primerForward & primerReverse & fastpForward & fastpReverse & fastpReport;
        }
};
BOOST_CLASS_VERSION(ReplicatePaths, 1)

/** @brief directory structure of a run, computed once on a cold start and restored on resume
 * @details <output>/<run>/{tag_removed, primer_removed, fastp, cells, checkpoints, reports, logs}.
 * Every well owns cells/<well>, only the worker of that well writes there.
**/
struct PathLayout
{
    std::string runDir;
    std::string tagDir;
    std::string primerDir;
    std::string fastpDir;
    std::string cellsDir;
    std::string checkpointDir;
    std::string reportDir;
    std::string logDir;
    std::vector<ReplicatePaths> replicates;

    //<checkpoints>/<prefix>_before_<stage>.checkpoint
    std::string checkpoint_path(const std::string& prefix, const std::string& stageName) const;
    //<checkpoints>/<prefix>_after_all.checkpoint
    std::string final_checkpoint_path(const std::string& prefix) const;

    std::string well_dir(const Well& well) const;
    //<logs>/<name>.log, the log file of external tool calls
    std::string tool_log(const std::string& name) const;
    std::vector<std::string> replicate_names() const;

    void create_directories() const;

    private:
        friend class boost::serialization::access;
        template<class Archive>
        void serialize(Archive& ar, const unsigned int /*version*/)
        {
            ar & runDir & tagDir & primerDir & fastpDir & cellsDir;
            ar & checkpointDir & reportDir & logDir;
            ar & replicates;
        }
};
BOOST_CLASS_VERSION(PathLayout, 1)

/**
 * @brief name of a replicate: the forward file name without .gz/.fastq/.fq,
 * repeated names get a _<index> suffix
**/
std::vector<std::string> make_replicate_names(const std::vector<std::string>& forwardFiles);

//name of the run directory from a strftime format (DATETIME_FORMAT)
std::string run_directory_name(const std::string& format, std::time_t time);

//layout below cfg.output/runName for all replicates of the config, nothing is created on disk
PathLayout make_path_layout(const PipelineConfig& cfg, const std::string& runName);
