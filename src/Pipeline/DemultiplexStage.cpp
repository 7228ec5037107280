#include "Stages.hpp"

#include "Demultiplexer.hpp"
#include "DemultiplexedStatistics.hpp"

void DemultiplexStage::run(PipelineState& state, RunContext& context)
{
    const BarcodeTable& table = context.table();
    for(const BarcodeOverlap& overlap : table.overlapping_pairs())
    {
        context.log.warning(name(), "barcode pair " + overlap.pair.first + "/" + overlap.pair.second + " of well " +
                                    overlap.shadowedWell.code() + " is assigned to " + overlap.assignedWell.code());
    }

    Demultiplexer demultiplexer(state.config.threads);
    OccupancyReport combined;
    for(const ReplicatePaths& replicate : state.layout.replicates)
    {
        if(context.is_cancelled())
        {
            throw StageError(name() + " was cancelled before replicate " + replicate.name);
        }

        context.log.info(name(), "demultiplexing " + replicate.fastpForward + " and " + replicate.fastpReverse);
        //unequal or corrupt read files are a FatalInputError and abort the run
        DemultiplexedResult result = demultiplexer.run(replicate.fastpForward, replicate.fastpReverse, table);
        result.write_wells(state.layout.cellsDir, replicate.name);

        OccupancyReport occupancy(result);
        occupancy.write(state.layout.reportDir, state.config.prefix + "_" + replicate.name);
        combined.combine_statistics(occupancy);

        context.log.info(name(), replicate.name + ": " + std::to_string(result.get_assigned()) + " of " +
                                 std::to_string(result.get_total()) + " read pairs assigned, " +
                                 std::to_string(result.get_discarded()) + " discarded");
    }

    combined.write(state.layout.reportDir, state.config.prefix);
    std::vector<Well> emptyWells = combined.get_empty_wells();
    std::vector<std::string> codes;
    for(const Well& well : emptyWells){codes.push_back(well.code());}
    context.log.info(name(), "Empty cells : [" + joinStrings(codes, ", ") + "]");
}
