#include "Stages.hpp"

void throw_on_well_failures(const std::string& stage, const WellRunSummary& summary, size_t wellNumber)
{
    if(!summary.skipped.empty())
    {
        throw StageError(stage + " was cancelled, " + std::to_string(summary.skipped.size()) + " of " +
                         std::to_string(wellNumber) + " wells were not processed");
    }
    if(!summary.failures.empty())
    {
        std::vector<std::string> codes;
        for(const WellFailure& failure : summary.failures)
        {
            codes.push_back(failure.well.code());
        }
        throw StageError(stage + " failed for " + std::to_string(summary.failures.size()) + " of " +
                         std::to_string(wellNumber) + " wells: " + joinStrings(codes, ", "));
    }
}

std::vector<StagePtr> make_default_stages()
{
    return {
        std::make_shared<TrimTagStage>(),
        std::make_shared<TrimPrimerStage>(),
        std::make_shared<QualityFilterStage>(),
        std::make_shared<DemultiplexStage>(),
        std::make_shared<AssemblyStage>(AssemblyMode::Pooled),
        std::make_shared<AssemblyStage>(AssemblyMode::PerReplicate),
        std::make_shared<HomologySearchStage>()
    };
}

std::vector<std::string> stage_names(const std::vector<StagePtr>& stages)
{
    std::vector<std::string> names;
    for(const StagePtr& stage : stages)
    {
        names.push_back(stage->name());
    }
    return names;
}
