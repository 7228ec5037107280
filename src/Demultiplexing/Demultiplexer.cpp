#include "Demultiplexer.hpp"

#include <functional>

/**
* @brief assign all read pairs of one batch, called from every thread of the pool.
* Each batch writes only into its own BatchResult, no locking is needed.
**/
void Demultiplexer::demultiplex_wrapper_batch(const std::vector<ReadPair>& lines,
                                              size_t batchStart, size_t batchEnd,
                                              const BarcodeTable& table,
                                              BatchResult& batchResult,
                                              std::atomic<unsigned long long>& lineCount)
{
    for(size_t i = batchStart; i < batchEnd; ++i)
    {
        const ReadPair& line = lines.at(i);
        BarcodePair suffixes(barcode_suffix(line.first.name), barcode_suffix(line.second.name));

        std::optional<size_t> wellIdx = table.find_well(suffixes);
        if(wellIdx.has_value())
        {
            batchResult.wellReads[wellIdx.value()].store_demultiplexed_read(line);
        }
        else
        {
            ++batchResult.discarded;
        }
        ++lineCount;
    }
}

DemultiplexedResult Demultiplexer::run(const std::vector<fastqLine>& forwardReads,
                                       const std::vector<fastqLine>& reverseReads,
                                       const BarcodeTable& table)
{
    // ensure both R1 and R2 have same length
    if(forwardReads.size() != reverseReads.size())
    {
        throw FatalInputError("R1(" + std::to_string(forwardReads.size()) + " reads) != R2(" +
                              std::to_string(reverseReads.size()) + " reads)");
    }

    std::vector<ReadPair> lines;
    lines.reserve(forwardReads.size());
    for(size_t i = 0; i < forwardReads.size(); ++i)
    {
        lines.emplace_back(forwardReads[i], reverseReads[i]);
    }

    const size_t batchNumber = (lines.size() + batchSize - 1) / batchSize;
    std::vector<BatchResult> batchResults(batchNumber);
    std::atomic<unsigned long long> lineCount(0);

    //generate a pool of threads
    boost::asio::thread_pool pool(threads);
    for(size_t batch = 0; batch < batchNumber; ++batch)
    {
        size_t batchStart = batch * batchSize;
        size_t batchEnd = std::min(lines.size(), batchStart + batchSize);
        boost::asio::post(pool, std::bind(
            &Demultiplexer::demultiplex_wrapper_batch,
            this,
            std::cref(lines),
            batchStart,
            batchEnd,
            std::cref(table),
            std::ref(batchResults.at(batch)),
            std::ref(lineCount)
        ));
    }
    pool.join();

    //merge batches in input order
    DemultiplexedResult result(table);
    for(BatchResult& batchResult : batchResults)
    {
        for(size_t wellIdx = 0; wellIdx < table.size(); ++wellIdx)
        {
            auto it = batchResult.wellReads.find(wellIdx);
            if(it != batchResult.wellReads.end())
            {
                result.add_reads(wellIdx, std::move(it->second));
            }
        }
        result.add_discarded(batchResult.discarded);
    }
    result.set_total(lineCount.load());

    return result;
}

DemultiplexedResult Demultiplexer::run(const std::string& forwardFile,
                                       const std::string& reverseFile,
                                       const BarcodeTable& table)
{
    std::vector<fastqLine> forwardReads = read_fastq_file(forwardFile);
    std::vector<fastqLine> reverseReads = read_fastq_file(reverseFile);
    if(forwardReads.size() != reverseReads.size())
    {
        throw FatalInputError(forwardFile + "(" + std::to_string(forwardReads.size()) + " reads) != " +
                              reverseFile + "(" + std::to_string(reverseReads.size()) + " reads)");
    }
    return run(forwardReads, reverseReads, table);
}
