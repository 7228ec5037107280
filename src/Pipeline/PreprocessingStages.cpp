#include "Stages.hpp"

#include <filesystem>

#include "ExternalCommand.hpp"

namespace
{

//runs the command of every replicate, a failing replicate does not stop the others
void run_per_replicate(const std::string& stage, const PipelineState& state, RunContext& context,
                       const std::function<std::vector<std::string>(const ReplicatePaths&)>& commandFor)
{
    std::vector<std::string> failed;
    for(const ReplicatePaths& replicate : state.layout.replicates)
    {
        if(context.is_cancelled())
        {
            throw StageError(stage + " was cancelled before replicate " + replicate.name);
        }

        std::vector<std::string> args = commandFor(replicate);
        const std::string logFile = state.layout.tool_log(stage + "_" + replicate.name);
        context.log.info(stage, "running " + build_command_line(args));
        try
        {
            run_command(args, logFile);
        }
        catch(const StageError& e)
        {
            context.log.error(stage, "replicate " + replicate.name + ": " + e.what());
            failed.push_back(replicate.name);
        }
    }

    if(!failed.empty())
    {
        throw StageError(stage + " failed for replicate(s) " + joinStrings(failed, ", "));
    }
}

}

void TrimTagStage::run(PipelineState& state, RunContext& context)
{
    const PipelineConfig& cfg = state.config;
    std::filesystem::create_directories(state.layout.tagDir);
    run_per_replicate(name(), state, context, [&cfg](const ReplicatePaths& replicate)
    {
        return std::vector<std::string>{
            cfg.cutadaptExe, "--no-indels", "--discard-untrimmed",
            "-g", "file:" + cfg.tagForward, "-G", "file:" + cfg.tagReverse,
            "-y", " {name}",
            "-o", replicate.tagForward, "-p", replicate.tagReverse,
            replicate.rawForward, replicate.rawReverse};
    });
}

void TrimPrimerStage::run(PipelineState& state, RunContext& context)
{
    const PipelineConfig& cfg = state.config;
    std::filesystem::create_directories(state.layout.primerDir);
    run_per_replicate(name(), state, context, [&cfg](const ReplicatePaths& replicate)
    {
        return std::vector<std::string>{
            cfg.cutadaptExe, "--discard-untrimmed",
            "-g", "file:" + cfg.primerForward, "-G", "file:" + cfg.primerReverse,
            "-o", replicate.primerForward, "-p", replicate.primerReverse,
            replicate.tagForward, replicate.tagReverse};
    });
}

void QualityFilterStage::run(PipelineState& state, RunContext& context)
{
    const PipelineConfig& cfg = state.config;
    std::filesystem::create_directories(state.layout.fastpDir);
    run_per_replicate(name(), state, context, [&cfg](const ReplicatePaths& replicate)
    {
        std::vector<std::string> args = {
            cfg.fastpExe, "-i", replicate.primerForward, "-I", replicate.primerReverse,
            "-o", replicate.fastpForward, "-O", replicate.fastpReverse, "-h", replicate.fastpReport};
        for(const std::string& param : splitByWhitespace(cfg.fastpParams))
        {
            args.push_back(param);
        }
        return args;
    });
}
