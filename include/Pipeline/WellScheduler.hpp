#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <vector>

#include "BarcodeTable.hpp"
#include "RunLog.hpp"

/// a well whose work threw, with the error message
struct WellFailure
{
    Well well;
    std::string message;
};

/// outcome of one per-well fan-out
struct WellRunSummary
{
    std::vector<WellFailure> failures;
    //wells that never started because the run was cancelled
    std::vector<Well> skipped;
    unsigned long long completed = 0;
};

/** @brief runs independent per-well work on a bounded pool of threads
 * @details one task per well is posted to a boost::asio::thread_pool, the call returns after the pool joined
 * so a stage boundary stays a barrier. After cancellation no further well is started, running wells finish.
 * A FatalInputError of any well is rethrown after the join, other exceptions are collected per well.
**/
class WellScheduler
{
    public:
        static WellRunSummary run(const std::vector<Well>& wells, int threads, const std::atomic<bool>& cancelled,
                                  const std::function<void(const Well&)>& fn, RunLog* log = nullptr,
                                  const std::string& stage = "");
};
