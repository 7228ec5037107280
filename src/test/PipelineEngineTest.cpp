#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <functional>
#include <map>
#include <sstream>

#include "PipelineEngine.hpp"
#include "TestHelper.hpp"

namespace
{

/// stage that counts its executions and runs an optional action
class CountingStage : public Stage
{
    public:
        CountingStage(const std::string& stageName, std::map<std::string, int>& executions,
                      std::function<void()> action = nullptr)
        : stageName(stageName), executions(executions), action(action)
        {}

        std::string name() const override { return stageName; }
        void run(PipelineState&, RunContext&) override
        {
            ++executions[stageName];
            if(action){action();}
        }

    private:
        std::string stageName;
        std::map<std::string, int>& executions;
        std::function<void()> action;
};

PipelineState engine_state(const TmpDir& dir, ErrorPolicy policy)
{
    PipelineState state;
    state.config.prefix = "run";
    state.config.onError = policy;
    state.layout.checkpointDir = dir.file("checkpoints");
    return state;
}

std::atomic<PipelineEngine*> signalledEngine{nullptr};

extern "C" void cancel_on_signal(int)
{
    PipelineEngine* engine = signalledEngine.load();
    if(engine != nullptr){engine->request_cancel();}
}

std::vector<StagePtr> counting_stages(std::map<std::string, int>& executions)
{
    std::vector<StagePtr> stages;
    for(const std::string& name : {"s0", "s1", "s2", "s3"})
    {
        stages.push_back(std::make_shared<CountingStage>(name, executions));
    }
    return stages;
}

}

TEST(PipelineEngine, runs_all_stages_and_writes_checkpoints)
{
    TmpDir dir("engine");
    std::ostringstream out, err;
    RunLog log(LogLevel::Info, "", out, err);
    std::map<std::string, int> executions;
    PipelineState state = engine_state(dir, ErrorPolicy::Halt);

    PipelineEngine engine(counting_stages(executions), log);
    RunSummary summary = engine.run(state);

    EXPECT_TRUE(summary.all_succeeded());
    EXPECT_EQ(summary.exit_code(), 0);
    EXPECT_EQ(summary.stages.size(), 4u);
    EXPECT_EQ(state.cursor, 4u);
    for(const std::string& name : {"s0", "s1", "s2", "s3"})
    {
        EXPECT_EQ(executions[name], 1);
        //checkpoint before the stage holds the cursor of that stage
        CheckpointHeader header;
        PipelineState saved = load_checkpoint(state.layout.checkpoint_path("run", name), &header);
        EXPECT_EQ(header.tag, "before_" + name);
        EXPECT_EQ(saved.cursor, header.position);
    }
    EXPECT_EQ(load_checkpoint(state.layout.final_checkpoint_path("run")).cursor, 4u);
    EXPECT_NE(out.str().find("INFO(s2): starting stage 3/4"), std::string::npos);
}

TEST(PipelineEngine, resume_skips_completed_stages)
{
    TmpDir dir("engine_resume");
    std::ostringstream out, err;
    RunLog log(LogLevel::Info, "", out, err);
    std::map<std::string, int> executions;

    //first run: the third stage fails and halts the run
    bool failing = true;
    std::vector<StagePtr> stages = counting_stages(executions);
    stages.at(2) = std::make_shared<CountingStage>("s2", executions, [&failing]()
    {
        if(failing){throw StageError("assembler crashed");}
    });

    PipelineState state = engine_state(dir, ErrorPolicy::Halt);
    PipelineEngine first(stages, log);
    RunSummary summary = first.run(state);
    EXPECT_TRUE(summary.halted);
    EXPECT_EQ(summary.exit_code(), 2);
    EXPECT_EQ(state.cursor, 2u);
    EXPECT_EQ(executions["s3"], 0);
    EXPECT_FALSE(std::filesystem::exists(state.layout.final_checkpoint_path("run")));
    EXPECT_NE(err.str().find("stage failed: assembler crashed"), std::string::npos);

    //resume from the checkpoint written before the failed stage
    failing = false;
    PipelineState resumed = load_checkpoint(state.layout.checkpoint_path("run", "s2"));
    EXPECT_EQ(resumed.cursor, 2u);
    PipelineEngine second(stages, log);
    summary = second.run(resumed);

    EXPECT_TRUE(summary.all_succeeded());
    EXPECT_EQ(summary.stages.size(), 2u);
    EXPECT_EQ(summary.stages.front().position, 2u);
    EXPECT_EQ(executions["s0"], 1);
    EXPECT_EQ(executions["s1"], 1);
    EXPECT_EQ(executions["s2"], 2);
    EXPECT_EQ(executions["s3"], 1);
    EXPECT_EQ(resumed.cursor, 4u);
    EXPECT_TRUE(std::filesystem::exists(state.layout.final_checkpoint_path("run")));
}

TEST(PipelineEngine, continue_policy_runs_later_stages)
{
    TmpDir dir("engine_continue");
    std::ostringstream out, err;
    RunLog log(LogLevel::Info, "", out, err);
    std::map<std::string, int> executions;

    std::vector<StagePtr> stages = counting_stages(executions);
    stages.at(1) = std::make_shared<CountingStage>("s1", executions, [](){ throw std::runtime_error("disk full"); });

    PipelineState state = engine_state(dir, ErrorPolicy::Continue);
    PipelineEngine engine(stages, log);
    RunSummary summary = engine.run(state);

    EXPECT_FALSE(summary.halted);
    EXPECT_FALSE(summary.all_succeeded());
    EXPECT_EQ(summary.exit_code(), 0);
    ASSERT_EQ(summary.stages.size(), 4u);
    EXPECT_FALSE(summary.stages.at(1).success);
    EXPECT_EQ(summary.stages.at(1).message, "disk full");
    EXPECT_EQ(executions["s3"], 1);
    //later successful stages advance the cursor past the failed one
    EXPECT_EQ(state.cursor, 4u);
    EXPECT_EQ(load_checkpoint(state.layout.final_checkpoint_path("run")).cursor, 4u);

    //the checkpoints after the failure agree with their stage
    CheckpointHeader header;
    PipelineState saved = load_checkpoint(state.layout.checkpoint_path("run", "s3"), &header);
    EXPECT_EQ(header.position, 3u);
    EXPECT_EQ(saved.cursor, 3u);
    //the failed stage did not advance the cursor
    EXPECT_EQ(load_checkpoint(state.layout.checkpoint_path("run", "s2")).cursor, 1u);

    //resuming from before_s3 runs only s3
    PipelineEngine resumed(stages, log);
    RunSummary second = resumed.run(saved);
    ASSERT_EQ(second.stages.size(), 1u);
    EXPECT_EQ(second.stages.front().stage, "s3");
    EXPECT_EQ(executions["s1"], 1);
    EXPECT_EQ(executions["s2"], 1);
    EXPECT_EQ(executions["s3"], 2);
}

TEST(PipelineEngine, cancellation_stops_before_next_stage)
{
    TmpDir dir("engine_cancel");
    std::ostringstream out, err;
    RunLog log(LogLevel::Info, "", out, err);
    std::map<std::string, int> executions;

    std::vector<StagePtr> stages = counting_stages(executions);
    PipelineEngine* enginePtr = nullptr;
    stages.at(1) = std::make_shared<CountingStage>("s1", executions, [&enginePtr](){ enginePtr->request_cancel(); });

    PipelineState state = engine_state(dir, ErrorPolicy::Continue);
    PipelineEngine engine(stages, log);
    enginePtr = &engine;
    RunSummary summary = engine.run(state);

    EXPECT_TRUE(summary.cancelled);
    EXPECT_TRUE(engine.cancel_requested());
    EXPECT_EQ(summary.exit_code(), 2);
    EXPECT_EQ(summary.stages.size(), 2u);
    EXPECT_EQ(executions["s2"], 0);
    EXPECT_EQ(state.cursor, 2u);
    EXPECT_FALSE(std::filesystem::exists(state.layout.checkpoint_path("run", "s2")));
    EXPECT_FALSE(std::filesystem::exists(state.layout.final_checkpoint_path("run")));
}

TEST(PipelineEngine, cancellation_from_signal_handler)
{
    TmpDir dir("engine_signal");
    std::ostringstream out, err;
    RunLog log(LogLevel::Info, "", out, err);
    std::map<std::string, int> executions;

    std::vector<StagePtr> stages = counting_stages(executions);
    stages.at(0) = std::make_shared<CountingStage>("s0", executions, [](){ std::raise(SIGUSR1); });

    PipelineState state = engine_state(dir, ErrorPolicy::Halt);
    PipelineEngine engine(stages, log);
    signalledEngine.store(&engine);
    std::signal(SIGUSR1, cancel_on_signal);
    RunSummary summary = engine.run(state);
    std::signal(SIGUSR1, SIG_DFL);
    signalledEngine.store(nullptr);

    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.exit_code(), 2);
    EXPECT_EQ(executions["s0"], 1);
    EXPECT_EQ(executions["s1"], 0);
    EXPECT_EQ(state.cursor, 1u);
}

TEST(PipelineEngine, fatal_input_error_aborts_run)
{
    TmpDir dir("engine_fatal");
    std::ostringstream out, err;
    RunLog log(LogLevel::Info, "", out, err);
    std::map<std::string, int> executions;

    std::vector<StagePtr> stages = counting_stages(executions);
    stages.at(0) = std::make_shared<CountingStage>("s0", executions, [](){ throw FatalInputError("R1(3 reads) != R2(2 reads)"); });

    PipelineState state = engine_state(dir, ErrorPolicy::Continue);
    PipelineEngine engine(stages, log);
    EXPECT_THROW(engine.run(state), FatalInputError);
    EXPECT_EQ(executions["s1"], 0);
    EXPECT_EQ(state.cursor, 0u);
    EXPECT_TRUE(std::filesystem::exists(state.layout.checkpoint_path("run", "s0")));
}

TEST(PipelineEngine, cursor_beyond_stages)
{
    TmpDir dir("engine_cursor");
    std::ostringstream out, err;
    RunLog log(LogLevel::Info, "", out, err);
    std::map<std::string, int> executions;

    PipelineState state = engine_state(dir, ErrorPolicy::Halt);
    state.cursor = 5;
    PipelineEngine engine(counting_stages(executions), log);
    EXPECT_THROW(engine.run(state), CheckpointError);

    //a finished run resumed from after_all does nothing
    state.cursor = 4;
    RunSummary summary = engine.run(state);
    EXPECT_TRUE(summary.stages.empty());
    EXPECT_TRUE(summary.all_succeeded());
    EXPECT_EQ(executions.size(), 0u);
}

TEST(RunSummary, write)
{
    RunSummary summary;
    summary.stages.push_back(StageResult{"trim_tag", 0, true, ""});
    summary.stages.push_back(StageResult{"trim_primer", 1, false, "cutadapt returned 1"});
    summary.halted = true;

    std::ostringstream os;
    summary.write(os);
    EXPECT_EQ(os.str(), "STAGES OF THIS RUN:\n\t0 trim_tag: done\n\t1 trim_primer: FAILED (cutadapt returned 1)\n"
                        "run halted after a failed stage\n");
}
