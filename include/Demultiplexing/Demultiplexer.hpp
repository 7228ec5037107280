#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <unordered_map>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>

#include "BarcodeTable.hpp"
#include "DemultiplexedResult.hpp"
#include "FastqReader.hpp"

/** @brief assigns read pairs to wells by the exact (forward-suffix, reverse-suffix) pair left on the read headers
 * @details reads are fully kept in RAM. They are split into batches which are processed by a pool of threads,
 * every batch collects its own per-well groups that are merged in batch order after the pool joined,
 * so the output keeps the input order within every well independent of the thread number.
 * A pair is assigned to the first well (in table order) accepting it, or counted as discarded.
**/
class Demultiplexer
{
    private:

        //per batch result: well index -> reads, plus pairs without a well
        struct BatchResult
        {
            std::unordered_map<size_t, DemultiplexedReads> wellReads;
            unsigned long long discarded = 0;
        };

        void demultiplex_wrapper_batch(const std::vector<ReadPair>& lines,
                                       size_t batchStart, size_t batchEnd,
                                       const BarcodeTable& table,
                                       BatchResult& batchResult,
                                       std::atomic<unsigned long long>& lineCount);

        int threads;
        size_t batchSize;

    public:

        explicit Demultiplexer(int threads = 1, size_t batchSize = 10000)
        : threads(threads < 1 ? 1 : threads), batchSize(batchSize == 0 ? 1 : batchSize)
        {}

        //the two read lists must have equal length, otherwise the inputs are corrupt (FatalInputError)
        DemultiplexedResult run(const std::vector<fastqLine>& forwardReads,
                                const std::vector<fastqLine>& reverseReads,
                                const BarcodeTable& table);

        //reads both fastq(.gz) files into memory and demultiplexes them
        DemultiplexedResult run(const std::string& forwardFile,
                                const std::string& reverseFile,
                                const BarcodeTable& table);
};
