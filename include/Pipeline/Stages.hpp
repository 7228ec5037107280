#pragma once

#include <functional>
#include <string>
#include <vector>

#include "Stage.hpp"
#include "Assembler.hpp"
#include "HomologySearch.hpp"

/// cutadapt without indels removes the well tags and appends the tag name to the read header
class TrimTagStage : public Stage
{
    public:
        std::string name() const override { return "trim_tag"; }
        void run(PipelineState& state, RunContext& context) override;
};

/// cutadapt removes the primers of the tag-trimmed reads
class TrimPrimerStage : public Stage
{
    public:
        std::string name() const override { return "trim_primer"; }
        void run(PipelineState& state, RunContext& context) override;
};

/// fastp quality filtering of the primer-trimmed reads
class QualityFilterStage : public Stage
{
    public:
        std::string name() const override { return "quality_filter"; }
        void run(PipelineState& state, RunContext& context) override;
};

/** @brief splits the filtered reads of every replicate into cells/<well>/<replicate>_R1/R2.fastq
 * @details writes one occupancy report per replicate and a combined one into the report directory
**/
class DemultiplexStage : public Stage
{
    public:
        std::string name() const override { return "demultiplex"; }
        void run(PipelineState& state, RunContext& context) override;
};

typedef std::function<AssemblerPtr(const PipelineConfig&)> AssemblerFactory;

/** @brief assembles every well, either from the reads of all replicates (pooled) or per replicate
 * @details wells are independent and run on the WellScheduler. Wells without reads are not assembled
 * and get an empty contig file.
**/
class AssemblyStage : public Stage
{
    public:
        explicit AssemblyStage(AssemblyMode mode, AssemblerFactory factory = make_assembler)
        : mode(mode), factory(factory)
        {}

        std::string name() const override
        {
            return mode == AssemblyMode::Pooled ? "assemble_pooled" : "assemble_replicates";
        }
        void run(PipelineState& state, RunContext& context) override;

    private:
        void assemble_well(const Well& well, const PipelineState& state, RunContext& context);

        AssemblyMode mode;
        AssemblerFactory factory;
};

typedef std::function<HomologySearchPtr(const PipelineConfig&, const std::string& logFile)> HomologySearchFactory;

HomologySearchPtr make_blastn_search(const PipelineConfig& cfg, const std::string& logFile);

/** @brief searches the contigs of every well and writes the call reports
 * @details pooled contigs are resolved with resolve_single, the replicate contigs with resolve_multi.
 * Reports: <reports>/<prefix>_pooled_calls.csv and <prefix>_replicate_calls.csv, filtered by REPORT_FILTER.
**/
class HomologySearchStage : public Stage
{
    public:
        explicit HomologySearchStage(HomologySearchFactory factory = make_blastn_search)
        : factory(factory)
        {}

        std::string name() const override { return "homology_search"; }
        void run(PipelineState& state, RunContext& context) override;

    private:
        HomologySearchFactory factory;
};

//the full pipeline in execution order
std::vector<StagePtr> make_default_stages();
std::vector<std::string> stage_names(const std::vector<StagePtr>& stages);
