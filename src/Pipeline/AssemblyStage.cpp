#include "Stages.hpp"

#include <filesystem>
#include <fstream>

#include "DemultiplexedResult.hpp"
#include "FastqReader.hpp"

namespace fs = std::filesystem;

namespace
{

//concatenates the replicate reads of a well into one file
void concatenate_files(const std::vector<std::string>& inputs, const std::string& output)
{
    std::ofstream out(output, std::ios::binary);
    if(!out)
    {
        throw StageError("Could not open pooled reads for writing: " + output);
    }
    for(const std::string& input : inputs)
    {
        std::ifstream in(input, std::ios::binary);
        if(!in)
        {
            throw StageError("Missing demultiplexed reads: " + input);
        }
        //inserting an empty buffer would set the failbit of out
        if(in.peek() != std::ifstream::traits_type::eof())
        {
            out << in.rdbuf();
        }
    }
    if(!out)
    {
        throw StageError("Writing pooled reads failed: " + output);
    }
}

}

void AssemblyStage::assemble_well(const Well& well, const PipelineState& state, RunContext& context)
{
    const fs::path wellDir = state.layout.well_dir(well);

    std::vector<AssemblyInput> inputs;
    if(mode == AssemblyMode::Pooled)
    {
        std::vector<std::string> forwardFiles, reverseFiles;
        for(const std::string& replicate : state.layout.replicate_names())
        {
            forwardFiles.push_back((wellDir / well_fastq_name(replicate, true)).string());
            reverseFiles.push_back((wellDir / well_fastq_name(replicate, false)).string());
        }

        AssemblyInput input;
        input.modeTag = "pooled";
        input.forwardReads = (wellDir / well_fastq_name(input.modeTag, true)).string();
        input.reverseReads = (wellDir / well_fastq_name(input.modeTag, false)).string();
        concatenate_files(forwardFiles, input.forwardReads);
        concatenate_files(reverseFiles, input.reverseReads);
        inputs.push_back(input);
    }
    else
    {
        for(const std::string& replicate : state.layout.replicate_names())
        {
            AssemblyInput input;
            input.modeTag = replicate;
            input.forwardReads = (wellDir / well_fastq_name(replicate, true)).string();
            input.reverseReads = (wellDir / well_fastq_name(replicate, false)).string();
            inputs.push_back(input);
        }
    }

    AssemblerPtr assembler = factory(state.config);
    for(AssemblyInput& input : inputs)
    {
        input.well = well;
        input.workDir = (wellDir / (input.modeTag + "_" + assembler->name() + "_out")).string();
        input.contigFile = (wellDir / contig_file_name(mode, input.modeTag)).string();
        input.logFile = (wellDir / (input.modeTag + "_" + assembler->name() + ".log")).string();

        if(!fs::exists(input.forwardReads) || !fs::exists(input.reverseReads))
        {
            throw StageError("Missing demultiplexed reads for well " + well.code() + ": " + input.forwardReads);
        }
        if(count_fastq_records(input.forwardReads) == 0)
        {
            context.log.debug(name(), "well " + well.code() + " (" + input.modeTag + ") has no reads, skipping assembly");
            write_fasta_file(input.contigFile, {});
            continue;
        }

        ContigSet contigs = assembler->assemble(input);
        context.log.debug(name(), "well " + well.code() + " (" + input.modeTag + "): " +
                                  std::to_string(contigs.contigs.size()) + " contigs");
    }
}

void AssemblyStage::run(PipelineState& state, RunContext& context)
{
    const std::vector<Well>& wells = context.table().get_wells();
    context.log.info(name(), "assembling " + std::to_string(wells.size()) + " wells with " +
                             assembler_name(state.config.assembler));

    WellRunSummary summary = WellScheduler::run(wells, state.config.threads, context.cancelled,
        [this, &state, &context](const Well& well){ assemble_well(well, state, context); },
        &context.log, name());

    throw_on_well_failures(name(), summary, wells.size());
}
