#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <ctime>
#include <csignal>
#include <filesystem>
#include <boost/program_options.hpp>

#include "PipelineConfig.hpp"
#include "PipelineEngine.hpp"
#include "Stages.hpp"
#include "CallReport.hpp"
#include "FastqReader.hpp"

/**
 * @brief PlateCall identifies the organism of every well of 96 well plates from paired-end reads:
 * tag and primer trimming, quality filtering, demultiplexing into wells, assembly (pooled and per replicate)
 * and a homology search whose hits are resolved into one call per well.
 * A run starts from a KEY=value ini file, the full state is checkpointed before every stage and a run can be
 * resumed from any checkpoint, optionally with an override ini file.
 *
 * exit codes: 0 all stages were run, 1 fatal error, 2 the run halted on a failed stage or was cancelled
**/

namespace fs = std::filesystem;
namespace po = boost::program_options;

struct input
{
    std::string config;
    std::vector<std::string> forward;
    std::vector<std::string> reverse;
    std::string assembler;
    std::string onError;
    std::string resume;
    std::string overrideFile;
    bool listStages = false;
};

//engine of the running pipeline, cancelled by SIGINT/SIGTERM. Set by main, read by the signal handler
static std::atomic<PipelineEngine*> runningEngine{nullptr};

extern "C" void handle_signal(int)
{
    PipelineEngine* engine = runningEngine.load();
    if(engine != nullptr)
    {
        engine->request_cancel();
    }
}

// Parse command-line arguments
bool parse_arguments(int argc, char** argv, input& input)
{
    try {
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help,h", "produce help message")
            ("config,c", po::value<std::string>(&input.config), "run.ini with all parameters of a new run")
            ("forward,1", po::value<std::vector<std::string>>(&input.forward)->multitoken(), "forward read file(s), one per replicate (overrides FORWARD)")
            ("reverse,2", po::value<std::vector<std::string>>(&input.reverse)->multitoken(), "reverse read file(s), one per replicate (overrides REVERSE)")
            ("assembler,a", po::value<std::string>(&input.assembler), "megahit, skesa or spades (overrides ASSEMBLER)")
            ("onError", po::value<std::string>(&input.onError), "continue or halt after a failed stage (overrides ON_ERROR)")
            ("resume,r", po::value<std::string>(&input.resume), "checkpoint file to resume a run from")
            ("override", po::value<std::string>(&input.overrideFile), "ini file whose keys replace the config of the resumed run")
            ("listStages", po::bool_switch(&input.listStages), "print the stages of the pipeline");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << "Usage: " << argv[0] << " -c run.ini [-1 R1.fastq ...] [-2 R2.fastq ...]\n";
            std::cout << "       " << argv[0] << " --resume <file.checkpoint> [--override override.ini]\n";
            std::cout << desc << "\n";
            return false;
        }

        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return false;
    }

    if(!input.listStages && input.config.empty() == input.resume.empty())
    {
        std::cerr << "Error: start a run with <-c run.ini> OR resume one with <--resume file.checkpoint>\n";
        return false;
    }
    if(!input.overrideFile.empty() && input.resume.empty())
    {
        std::cerr << "Error: <--override> can only be used together with <--resume>\n";
        return false;
    }
    return true;
}

//fatal startup checks of a new run: all input files exist and every replicate has as many forward as reverse reads
void check_inputs(const PipelineConfig& cfg)
{
    for(const std::string& file : {cfg.tagForward, cfg.tagReverse, cfg.primerForward, cfg.primerReverse})
    {
        if(!fs::exists(file))
        {
            throw FatalInputError("File does not exist: " + file);
        }
    }
    for(size_t i = 0; i < cfg.forward.size(); ++i)
    {
        unsigned long long forwardReads = count_fastq_records(cfg.forward.at(i));
        unsigned long long reverseReads = count_fastq_records(cfg.reverse.at(i));
        if(forwardReads != reverseReads)
        {
            throw FatalInputError(cfg.forward.at(i) + "(" + std::to_string(forwardReads) + " reads) != " +
                                  cfg.reverse.at(i) + "(" + std::to_string(reverseReads) + " reads)");
        }
    }
}

PipelineState cold_start(const input& input)
{
    PipelineState state;
    PipelineConfig& cfg = state.config;
    cfg = load_config_from_file(input.config);
    if(!input.forward.empty()){cfg.forward = input.forward;}
    if(!input.reverse.empty()){cfg.reverse = input.reverse;}
    if(!input.assembler.empty()){cfg.assembler = parse_assembler(input.assembler);}
    if(!input.onError.empty()){cfg.onError = parse_error_policy(input.onError);}
    cfg.validate();
    parse_report_filter(cfg.reportFilter);
    check_inputs(cfg);

    state.layout = make_path_layout(cfg, run_directory_name(cfg.datetimeFormat, std::time(nullptr)));
    state.layout.create_directories();
    if(cfg.logFile.empty())
    {
        cfg.logFile = state.layout.tool_log("platecall");
    }
    state.cursor = 0;
    return state;
}

PipelineState resume(const input& input)
{
    CheckpointHeader header;
    PipelineState state = load_checkpoint(input.resume, &header);
    std::cout << "Resuming from " << input.resume << " (" << header.tag << "), next stage: " << state.cursor << "\n";
    if(!input.overrideFile.empty())
    {
        std::vector<std::string> keys = apply_override_file(state.config, input.overrideFile);
        std::cout << "Override " << input.overrideFile << " replaced: " << joinStrings(keys, ", ") << "\n";
        parse_report_filter(state.config.reportFilter);
    }
    state.layout.create_directories();
    return state;
}

int main(int argc, char** argv)
{
    //PARSE PARAMETERS
    input input;
    if (!parse_arguments(argc, argv, input))
    {
        return EXIT_FAILURE;
    }

    if(input.listStages)
    {
        for(const std::string& name : stage_names(make_default_stages()))
        {
            std::cout << name << "\n";
        }
        return EXIT_SUCCESS;
    }

    try
    {
        PipelineState state = input.resume.empty() ? cold_start(input) : resume(input);
        state.config.write();

        RunLog log(parse_log_level(state.config.logLevel), state.config.logFile);
        std::shared_ptr<const BarcodeTable> table = std::make_shared<const BarcodeTable>(BarcodeTable::load(state.config.barcodes));

        PipelineEngine engine(make_default_stages(), log, table);
        runningEngine.store(&engine);
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        RunSummary summary;
        try
        {
            summary = engine.run(state);
        }
        catch(...)
        {
            runningEngine.store(nullptr);
            throw;
        }
        runningEngine.store(nullptr);

        summary.write(std::cout);
        if(summary.exit_code() != 0)
        {
            std::cerr << "Run stopped, resume with: " << argv[0] << " --resume <checkpoint> from " << state.layout.checkpointDir << "\n";
        }
        return summary.exit_code();
    }
    catch(const FatalInputError& e)
    {
        std::cerr << "EXITING PLATECALL, fatal input error: " << e.what() << "\n";
    }
    catch(const ConfigError& e)
    {
        std::cerr << "EXITING PLATECALL, invalid configuration: " << e.what() << "\n";
    }
    catch(const std::exception& e)
    {
        std::cerr << "EXITING PLATECALL: " << e.what() << "\n";
    }
    return EXIT_FAILURE;
}
