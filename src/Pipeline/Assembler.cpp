#include "Assembler.hpp"

#include <filesystem>

#include "ExternalCommand.hpp"

namespace fs = std::filesystem;

std::string contig_file_name(AssemblyMode mode, const std::string& modeTag)
{
    if(mode == AssemblyMode::Pooled)
    {
        return "contigs.fasta";
    }
    return modeTag + "_contigs.fasta";
}

ContigSet Assembler::assemble(const AssemblyInput& input)
{
    ContigSet contigSet;
    contigSet.well = input.well;
    contigSet.modeTag = input.modeTag;
    contigSet.sourceFile = input.contigFile;

    //the engines refuse to write into an existing output directory
    std::error_code ec;
    fs::remove_all(input.workDir, ec);
    if(ec)
    {
        throw StageError("Could not clean assembler directory " + input.workDir + ": " + ec.message());
    }
    if(fs::path(input.workDir).has_parent_path()){fs::create_directories(fs::path(input.workDir).parent_path());}

    std::string engineContigs = run_engine(input);
    if(fs::exists(engineContigs))
    {
        contigSet.contigs = read_fasta_file(engineContigs);
    }
    write_fasta_file(input.contigFile, contigSet.contigs);

    return contigSet;
}

std::string MegahitAssembler::run_engine(const AssemblyInput& input)
{
    std::vector<std::string> args = {executable, "-1", input.forwardReads, "-2", input.reverseReads, "-o", input.workDir};
    args.insert(args.end(), params.begin(), params.end());
    run_command(args, input.logFile);
    return (fs::path(input.workDir) / "final.contigs.fa").string();
}

std::string SkesaAssembler::run_engine(const AssemblyInput& input)
{
    fs::create_directories(input.workDir);
    const std::string contigs = (fs::path(input.workDir) / "contigs.fa").string();
    std::vector<std::string> args = {executable, "--reads", input.forwardReads + "," + input.reverseReads,
                                     "--contigs_out", contigs};
    args.insert(args.end(), params.begin(), params.end());
    run_command(args, input.logFile);
    return contigs;
}

std::string SpadesAssembler::run_engine(const AssemblyInput& input)
{
    std::vector<std::string> args = {executable, "-1", input.forwardReads, "-2", input.reverseReads, "-o", input.workDir};
    args.insert(args.end(), params.begin(), params.end());
    run_command(args, input.logFile);
    return (fs::path(input.workDir) / "contigs.fasta").string();
}

AssemblerPtr make_assembler(const PipelineConfig& cfg)
{
    switch(cfg.assembler)
    {
        case AssemblerEngine::Megahit:
            return std::make_unique<MegahitAssembler>(cfg.megahitExe, cfg.megahitParams);
        case AssemblerEngine::Skesa:
            return std::make_unique<SkesaAssembler>(cfg.skesaExe, cfg.skesaParams);
        case AssemblerEngine::Spades:
            return std::make_unique<SpadesAssembler>(cfg.spadesExe, cfg.spadesParams);
    }
    throw ConfigError("Unknown assembler engine");
}
