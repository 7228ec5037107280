#pragma once

#include <atomic>
#include <memory>

#include "RunLog.hpp"
#include "BarcodeTable.hpp"

/** @brief live handles of a run that stages need besides the PipelineState
 * @details built by the caller on every start or resume, never written to a checkpoint
**/
struct RunContext
{
    RunContext(RunLog& log, const std::atomic<bool>& cancelled, std::shared_ptr<const BarcodeTable> barcodeTable = nullptr)
    : log(log), cancelled(cancelled), barcodeTable(barcodeTable)
    {}

    bool is_cancelled() const { return cancelled.load(); }

    //the table loaded at startup, stages that need wells throw a StageError if it is missing
    const BarcodeTable& table() const
    {
        if(!barcodeTable)
        {
            throw StageError("No barcode table was loaded for this run");
        }
        return *barcodeTable;
    }

    RunLog& log;
    const std::atomic<bool>& cancelled;
    std::shared_ptr<const BarcodeTable> barcodeTable;
};
