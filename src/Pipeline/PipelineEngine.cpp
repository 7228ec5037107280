#include "PipelineEngine.hpp"

bool RunSummary::all_succeeded() const
{
    for(const StageResult& result : stages)
    {
        if(!result.success){return false;}
    }
    return !halted && !cancelled;
}

void RunSummary::write(std::ostream& os) const
{
    os << "STAGES OF THIS RUN:\n";
    for(const StageResult& result : stages)
    {
        os << "\t" << result.position << " " << result.stage << ": " << (result.success ? "done" : "FAILED");
        if(!result.message.empty()){os << " (" << result.message << ")";}
        os << "\n";
    }
    if(halted){os << "run halted after a failed stage\n";}
    if(cancelled){os << "run was cancelled\n";}
}

RunSummary PipelineEngine::run(PipelineState& state)
{
    RunSummary summary;
    RunContext context(log, cancelled, table);
    const std::string& prefix = state.config.prefix;

    if(state.cursor > stages.size())
    {
        throw CheckpointError("Stage cursor " + std::to_string(state.cursor) + " is beyond the " +
                              std::to_string(stages.size()) + " stages of this pipeline");
    }

    for(size_t i = state.cursor; i < stages.size(); ++i)
    {
        const StagePtr& stage = stages.at(i);
        if(cancelled.load())
        {
            log.warning(stage->name(), "run cancelled, stage is not started");
            summary.cancelled = true;
            break;
        }

        save_checkpoint(state.layout.checkpoint_path(prefix, stage->name()), "before_" + stage->name(), i, state);
        log.info(stage->name(), "starting stage " + std::to_string(i + 1) + "/" + std::to_string(stages.size()));

        StageResult result;
        result.stage = stage->name();
        result.position = i;
        try
        {
            stage->run(state, context);
            result.success = true;
            state.cursor = i + 1;
            log.info(stage->name(), "finished");
        }
        catch(const FatalInputError& e)
        {
            log.error(stage->name(), std::string("fatal input error, aborting the run: ") + e.what());
            throw;
        }
        catch(const std::exception& e)
        {
            result.message = e.what();
            log.error(stage->name(), "stage failed: " + result.message + " (cursor " + std::to_string(state.cursor) +
                                     ", resume from " + state.layout.checkpoint_path(prefix, stage->name()) + ")");
        }
        summary.stages.push_back(result);

        if(!result.success)
        {
            if(cancelled.load())
            {
                summary.cancelled = true;
                break;
            }
            if(state.config.onError == ErrorPolicy::Halt)
            {
                summary.halted = true;
                break;
            }
        }
    }

    if(!summary.halted && !summary.cancelled)
    {
        save_checkpoint(state.layout.final_checkpoint_path(prefix), "after_all", stages.size(), state);
    }
    return summary;
}
