#pragma once

#include <string>
#include <vector>

#include "BarcodeTable.hpp"
#include "DemultiplexedLine.hpp"

/** @brief read pairs of every well of the barcode table (in table order) plus the discarded pairs
 * @details every input pair ends in exactly one well or in the discarded count
**/
class DemultiplexedResult
{
    public:

        explicit DemultiplexedResult(const BarcodeTable& table)
        : wells(table.get_wells()), readsPerWell(table.size())
        {}

        void add_reads(size_t wellIdx, DemultiplexedReads&& reads)
        {
            readsPerWell.at(wellIdx).append(std::move(reads));
        }
        void add_discarded(unsigned long long discarded)
        {
            ullong_save_add(discardedPairs, discarded);
        }
        void set_total(unsigned long long total)
        {
            totalPairs = total;
        }

        const std::vector<Well>& get_wells() const { return wells; }
        const DemultiplexedReads& reads_at(size_t wellIdx) const { return readsPerWell.at(wellIdx); }
        //reads of a well, throws std::out_of_range for wells that are not part of the table
        const DemultiplexedReads& get_reads(const Well& well) const;

        unsigned long long get_discarded() const { return discardedPairs; }
        unsigned long long get_total() const { return totalPairs; }
        unsigned long long get_assigned() const;

        //writes cellsDir/<well>/<replicate>_R1.fastq and _R2.fastq for every well (empty wells get empty files),
        //every well directory is only written by this call
        void write_wells(const std::string& cellsDir, const std::string& replicate) const;

    private:

        std::vector<Well> wells;
        std::vector<DemultiplexedReads> readsPerWell;
        unsigned long long discardedPairs = 0;
        unsigned long long totalPairs = 0;
};

//file names of the demultiplexed reads of one replicate inside a well directory
std::string well_fastq_name(const std::string& replicate, bool forward);
