#pragma once

#include <string>
#include <memory>

#include "PipelineState.hpp"
#include "RunContext.hpp"
#include "WellScheduler.hpp"

/** @brief one named step of the pipeline
 * @details a stage reads and writes files of the PathLayout and reports failures by throwing:
 * StageError (or any std::exception) lets the engine apply the error policy,
 * FatalInputError aborts the whole run.
**/
class Stage
{
    public:
        virtual ~Stage() = default;

        virtual std::string name() const = 0;
        virtual void run(PipelineState& state, RunContext& context) = 0;
};
typedef std::shared_ptr<Stage> StagePtr;

//throws a StageError if wells failed or were skipped by a cancellation
void throw_on_well_failures(const std::string& stage, const WellRunSummary& summary, size_t wellNumber);
