#include "Stages.hpp"

#include <filesystem>
#include <map>
#include <optional>

#include "CallReport.hpp"
#include "ConsensusResolver.hpp"
#include "DemultiplexedResult.hpp"
#include "FastqReader.hpp"

namespace fs = std::filesystem;

namespace
{

//calls of one well, written only by the worker of that well
struct WellCalls
{
    std::optional<ConsensusCall> pooled;
    std::optional<ConsensusCall> replicate;
    unsigned long long rawCount = 0;
    unsigned long long pooledQueries = 0;
    unsigned long long replicateQueries = 0;
};

//number of searched contigs of the sets that contributed to a call
unsigned long long contributing_queries(const ConsensusCall& call, const std::vector<HomologyResultSet>& resultSets)
{
    std::vector<std::string> files = splitByDelimiter(call.queryFile, ":");
    unsigned long long queries = 0;
    for(const HomologyResultSet& resultSet : resultSets)
    {
        if(std::find(files.begin(), files.end(), resultSet.queryFile) != files.end())
        {
            queries += resultSet.query_count();
        }
    }
    return queries;
}

}

HomologySearchPtr make_blastn_search(const PipelineConfig& cfg, const std::string& logFile)
{
    return std::make_shared<BlastnSearch>(cfg.blastnExe, cfg.blastParams, logFile);
}

void HomologySearchStage::run(PipelineState& state, RunContext& context)
{
    const PipelineConfig& cfg = state.config;
    const std::vector<Well>& wells = context.table().get_wells();
    const std::vector<std::string> replicates = state.layout.replicate_names();
    CallReportFilter filter = parse_report_filter(cfg.reportFilter);

    std::vector<WellCalls> calls(wells.size());
    std::map<Well, size_t> slots;
    for(size_t i = 0; i < wells.size(); ++i){slots[wells.at(i)] = i;}

    auto search_well = [&](const Well& well)
    {
        WellCalls& wellCalls = calls.at(slots.at(well));
        const fs::path wellDir = state.layout.well_dir(well);
        HomologySearchPtr search = factory(cfg, (wellDir / "blastn.log").string());

        for(const std::string& replicate : replicates)
        {
            const std::string reads = (wellDir / well_fastq_name(replicate, true)).string();
            if(fs::exists(reads)){wellCalls.rawCount += count_fastq_records(reads);}
        }

        //pooled contigs, a single ContigSet
        const std::string pooledContigs = (wellDir / contig_file_name(AssemblyMode::Pooled, "pooled")).string();
        if(fs::exists(pooledContigs))
        {
            HomologyResultSet resultSet = search->search(pooledContigs);
            wellCalls.pooledQueries = resultSet.query_count();
            wellCalls.pooled = resolve_single(resultSet);
        }
        else
        {
            context.log.warning(name(), "well " + well.code() + " has no pooled contigs");
        }

        //one ContigSet per replicate
        std::vector<HomologyResultSet> resultSets;
        for(const std::string& replicate : replicates)
        {
            const std::string contigs = (wellDir / contig_file_name(AssemblyMode::PerReplicate, replicate)).string();
            if(!fs::exists(contigs))
            {
                context.log.warning(name(), "well " + well.code() + " has no contigs of replicate " + replicate);
                continue;
            }
            resultSets.push_back(search->search(contigs));
        }
        wellCalls.replicate = resolve_multi(resultSets);
        if(wellCalls.replicate.has_value())
        {
            wellCalls.replicateQueries = contributing_queries(wellCalls.replicate.value(), resultSets);
        }
    };

    context.log.info(name(), "searching contigs of " + std::to_string(wells.size()) + " wells");
    WellRunSummary summary = WellScheduler::run(wells, cfg.threads, context.cancelled, search_well, &context.log, name());

    //reports hold every well that finished, even if others failed
    CallReport pooledReport, replicateReport;
    for(size_t i = 0; i < wells.size(); ++i)
    {
        const WellCalls& wellCalls = calls.at(i);
        pooledReport.add_call(wells.at(i), wellCalls.pooled, wellCalls.rawCount, wellCalls.pooledQueries);
        replicateReport.add_call(wells.at(i), wellCalls.replicate, wellCalls.rawCount, wellCalls.replicateQueries);
    }
    pooledReport.filter(filter);
    replicateReport.filter(filter);

    const std::string pooledPath = (fs::path(state.layout.reportDir) / (cfg.prefix + "_pooled_calls.csv")).string();
    const std::string replicatePath = (fs::path(state.layout.reportDir) / (cfg.prefix + "_replicate_calls.csv")).string();
    pooledReport.write(pooledPath);
    replicateReport.write(replicatePath);
    context.log.info(name(), std::to_string(pooledReport.size()) + " pooled calls written to " + pooledPath);
    context.log.info(name(), std::to_string(replicateReport.size()) + " replicate calls written to " + replicatePath);

    throw_on_well_failures(name(), summary, wells.size());
}
