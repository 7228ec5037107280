#include "PathLayout.hpp"

#include <filesystem>
#include <map>

namespace fs = std::filesystem;

std::string PathLayout::checkpoint_path(const std::string& prefix, const std::string& stageName) const
{
    return (fs::path(checkpointDir) / (prefix + "_before_" + stageName + ".checkpoint")).string();
}

std::string PathLayout::final_checkpoint_path(const std::string& prefix) const
{
    return (fs::path(checkpointDir) / (prefix + "_after_all.checkpoint")).string();
}

std::string PathLayout::well_dir(const Well& well) const
{
    return (fs::path(cellsDir) / well.code()).string();
}

std::string PathLayout::tool_log(const std::string& name) const
{
    return (fs::path(logDir) / (name + ".log")).string();
}

std::vector<std::string> PathLayout::replicate_names() const
{
    std::vector<std::string> names;
    for(const ReplicatePaths& replicate : replicates)
    {
        names.push_back(replicate.name);
    }
    return names;
}

void PathLayout::create_directories() const
{
    for(const std::string& dir : {runDir, tagDir, primerDir, fastpDir, cellsDir, checkpointDir, reportDir, logDir})
    {
        fs::create_directories(dir);
    }
}

std::vector<std::string> make_replicate_names(const std::vector<std::string>& forwardFiles)
{
    std::vector<std::string> names;
    std::map<std::string, int> seen;
    for(const std::string& file : forwardFiles)
    {
        std::string name = fs::path(file).filename().string();
        for(const std::string& ending : {std::string(".gz"), std::string(".fastq"), std::string(".fq")})
        {
            if(endWith(name, ending)){name = name.substr(0, name.size() - ending.size());}
        }
        if(name.empty()){name = "replicate";}

        int count = ++seen[name];
        //"pooled" names the merged contigs of a well
        if(count > 1 || name == "pooled")
        {
            name += "_" + std::to_string(names.size() + 1);
        }
        names.push_back(name);
    }
    return names;
}

std::string run_directory_name(const std::string& format, std::time_t time)
{
    char buffer[256];
    std::tm localTime = *std::localtime(&time);
    size_t len = std::strftime(buffer, sizeof(buffer), format.c_str(), &localTime);
    if(len == 0)
    {
        throw ConfigError("DATETIME_FORMAT '" + format + "' produces an empty run directory name");
    }
    return std::string(buffer, len);
}

PathLayout make_path_layout(const PipelineConfig& cfg, const std::string& runName)
{
    PathLayout layout;
    fs::path run = fs::path(cfg.output) / runName;
    layout.runDir = run.string();
    layout.tagDir = (run / "tag_removed").string();
    layout.primerDir = (run / "primer_removed").string();
    layout.fastpDir = (run / "fastp").string();
    layout.cellsDir = (run / "cells").string();
    layout.checkpointDir = (run / "checkpoints").string();
    layout.reportDir = (run / "reports").string();
    layout.logDir = (run / "logs").string();

    std::vector<std::string> names = make_replicate_names(cfg.forward);
    for(size_t i = 0; i < names.size(); ++i)
    {
        const std::string& name = names.at(i);
        ReplicatePaths replicate;
        replicate.name = name;
        replicate.rawForward = cfg.forward.at(i);
        replicate.rawReverse = cfg.reverse.at(i);
        replicate.tagForward = (fs::path(layout.tagDir) / (name + "_R1.fastq")).string();
        replicate.tagReverse = (fs::path(layout.tagDir) / (name + "_R2.fastq")).string();
        replicate.primerForward = (fs::path(layout.primerDir) / (name + "_R1.fastq")).string();
        replicate.primerReverse = (fs::path(layout.primerDir) / (name + "_R2.fastq")).string();
        replicate.fastpForward = (fs::path(layout.fastpDir) / (name + "_R1.fastq")).string();
        replicate.fastpReverse = (fs::path(layout.fastpDir) / (name + "_R2.fastq")).string();
        replicate.fastpReport = (fs::path(layout.fastpDir) / (name + "_report.html")).string();
        layout.replicates.push_back(replicate);
    }
    return layout;
}
