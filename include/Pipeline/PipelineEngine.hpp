#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "Stage.hpp"

/// result of one executed stage
struct StageResult
{
    std::string stage;
    size_t position = 0;
    bool success = false;
    std::string message;
};

/** @brief what happened during PipelineEngine::run
 * @details exit code 0 if the stage list was worked through (failed stages included under the continue policy),
 * 2 if the run halted on a stage error or was cancelled
**/
struct RunSummary
{
    std::vector<StageResult> stages;
    bool halted = false;
    bool cancelled = false;

    bool all_succeeded() const;
    int exit_code() const { return (halted || cancelled) ? 2 : 0; }
    void write(std::ostream& os) const;
};

/** @brief resumable state machine over an ordered list of stages
 * @details before stage i runs, the whole PipelineState is written to <checkpoints>/<prefix>_before_<stage>.checkpoint.
 * A successful stage moves the cursor to i+1, a failed stage leaves it and the error policy decides
 * whether the next stage runs. After the last stage <prefix>_after_all.checkpoint is written unless the run
 * halted or was cancelled. Only this engine writes checkpoints, always between stages.
**/
class PipelineEngine
{
    public:
        PipelineEngine(std::vector<StagePtr> stages, RunLog& log, std::shared_ptr<const BarcodeTable> table = nullptr)
        : stages(std::move(stages)), log(log), table(table)
        {}

        //runs from state.cursor, a FatalInputError of a stage is rethrown after it was logged
        RunSummary run(PipelineState& state);

        //stops the run before the next stage, running per-well work finishes
        void request_cancel() { cancelled.store(true); }
        bool cancel_requested() const { return cancelled.load(); }

        const std::vector<StagePtr>& get_stages() const { return stages; }

    private:
        std::vector<StagePtr> stages;
        RunLog& log;
        std::shared_ptr<const BarcodeTable> table;
        std::atomic<bool> cancelled{false};
};
