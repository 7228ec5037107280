#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <utility>
#include <functional>
#include <optional>

#include "helper.hpp"

constexpr int PLATE_ROWS = 8;
constexpr int PLATE_COLUMNS = 12;

/** @brief one position on a multi-well plate, rendered as a 4 character code:
 * plate digit, row letter A-H, two digit column 01-12 (e.g. 1A01)
**/
struct Well
{
    int plate = 0;
    char row = 'A';
    int column = 0;

    //throws FatalInputError for anything that is not a valid 4 character well code
    static Well from_code(const std::string& code);
    std::string code() const;
    int row_index() const { return row - 'A'; }

    bool operator==(const Well& other) const
    {
        return plate == other.plate && row == other.row && column == other.column;
    }
    bool operator!=(const Well& other) const { return !(*this == other); }
    bool operator<(const Well& other) const
    {
        if(plate != other.plate){return plate < other.plate;}
        if(row != other.row){return row < other.row;}
        return column < other.column;
    }
};

//forward and reverse barcode suffix of a read pair
typedef std::pair<std::string, std::string> BarcodePair;

struct BarcodePairHash
{
    std::size_t operator()(const BarcodePair& p) const
    {
        std::size_t h = std::hash<std::string>{}(p.first);
        h ^= std::hash<std::string>{}(p.second) + 0x9e3779b9 + (h << 6) + (h >> 2);  // boost-style hash combine
        return h;
    }
};

/// a barcode pair that is accepted by more than one well
struct BarcodeOverlap
{
    BarcodePair pair;
    Well assignedWell;
    Well shadowedWell;
};

/** @brief static mapping of well -> accepted (forward-suffix, reverse-suffix) pairs
 * @details wells keep the order of the descriptor. The inverse index maps every pair to the FIRST well
 * (in table order) that accepts it. Pairs shared by several wells are a defect of the descriptor
 * and are reported by overlapping_pairs(), the read is still assigned to the first well.
 * The table is read-only after loading and shared between worker threads.
**/
class BarcodeTable
{
    public:

        //parse the json descriptor: {"1A01": [["BC1","BC2"], ...], ...}
        static BarcodeTable load(const std::string& path);

        //throws FatalInputError if the well already exists
        void add_well(const Well& well, const std::vector<BarcodePair>& pairs);

        //index of the well accepting this pair, empty if no well does
        std::optional<size_t> find_well(const BarcodePair& pair) const
        {
            auto it = inverseIndex.find(pair);
            if(it == inverseIndex.end()){return std::nullopt;}
            return it->second;
        }
        bool accepts(size_t wellIdx, const BarcodePair& pair) const;

        const std::vector<Well>& get_wells() const { return wells; }
        const Well& well_at(size_t idx) const { return wells.at(idx); }
        const std::vector<BarcodePair>& pairs_at(size_t idx) const { return acceptedPairs.at(idx); }
        size_t size() const { return wells.size(); }
        std::optional<size_t> index_of(const Well& well) const;

        //all plates referenced by the table in ascending order
        std::vector<int> get_plates() const;

        const std::vector<BarcodeOverlap>& overlapping_pairs() const { return overlaps; }

    private:

        std::vector<Well> wells;
        std::vector<std::vector<BarcodePair>> acceptedPairs;
        std::unordered_map<BarcodePair, size_t, BarcodePairHash> inverseIndex;
        std::map<Well, size_t> wellIndex;
        std::vector<BarcodeOverlap> overlaps;
};
