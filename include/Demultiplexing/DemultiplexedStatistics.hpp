#pragma once

#include <iostream>
#include <string>
#include <map>
#include <vector>
#include <memory>

#include "BarcodeTable.hpp"
#include "DemultiplexedResult.hpp"

/** @brief number of read pairs per well, organized as one 8x12 grid per plate
 * @details built from a DemultiplexedResult, several replicates are summed up with combine_statistics.
 * Wells that are in the barcode table but received no reads are reported as empty.
**/
class OccupancyReport
{
    public:

        OccupancyReport() = default;
        explicit OccupancyReport(const DemultiplexedResult& result);

        void update(const Well& well, unsigned long long readCount);
        void combine_statistics(const std::vector<std::shared_ptr<OccupancyReport>>& statisticsList);
        void combine_statistics(const OccupancyReport& other);

        //one grid per plate, the empty wells and the discarded/total counts
        void write(std::ostream& os) const;
        //same text written to <directory>/<prefix>_occupancy.txt
        void write(const std::string& directory, const std::string& prefix) const;

        //GETTER FUNCTIONS
        ///read pairs of a well, zero for unknown wells
        unsigned long long get_count(const Well& well) const
        {
            auto it = readsPerWell.find(well);
            return it == readsPerWell.end() ? 0 : it->second;
        }
        ///wells without a single read pair, sorted by plate/row/column
        std::vector<Well> get_empty_wells() const;
        ///pairs that matched no well
        unsigned long long get_discarded() const
        {
            return discarded;
        }
        ///all input pairs
        unsigned long long get_total() const
        {
            return total;
        }
        const std::map<Well, unsigned long long>& get_counts() const
        {
            return readsPerWell;
        }

    private:

        //key is the well, value the number of read pairs in it
        std::map<Well, unsigned long long> readsPerWell;
        unsigned long long discarded = 0;
        unsigned long long total = 0;
};
