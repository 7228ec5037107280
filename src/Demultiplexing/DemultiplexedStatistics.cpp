#include "DemultiplexedStatistics.hpp"

#include <fstream>
#include <iomanip>
#include <set>
#include <filesystem>

OccupancyReport::OccupancyReport(const DemultiplexedResult& result)
{
    const std::vector<Well>& wells = result.get_wells();
    for(size_t i = 0; i < wells.size(); ++i)
    {
        update(wells.at(i), result.reads_at(i).size());
    }
    discarded = result.get_discarded();
    total = result.get_total();
}

void OccupancyReport::update(const Well& well, unsigned long long readCount)
{
    ullong_save_add(readsPerWell[well], readCount);
}

void OccupancyReport::combine_statistics(const OccupancyReport& other)
{
    for(const auto& [well, count] : other.readsPerWell)
    {
        update(well, count);
    }
    ullong_save_add(discarded, other.discarded);
    ullong_save_add(total, other.total);
}

void OccupancyReport::combine_statistics(const std::vector<std::shared_ptr<OccupancyReport>>& statisticsList)
{
    for(const std::shared_ptr<OccupancyReport>& stats : statisticsList)
    {
        if(stats){combine_statistics(*stats);}
    }
}

std::vector<Well> OccupancyReport::get_empty_wells() const
{
    std::vector<Well> emptyWells;
    for(const auto& [well, count] : readsPerWell)
    {
        if(count == 0){emptyWells.push_back(well);}
    }
    return emptyWells;
}

void OccupancyReport::write(std::ostream& os) const
{
    std::set<int> plates;
    for(const auto& [well, count] : readsPerWell){plates.insert(well.plate);}

    //width of a column is defined by the largest count
    size_t width = 2;
    for(const auto& [well, count] : readsPerWell)
    {
        width = std::max(width, std::to_string(count).size());
    }

    for(int plate : plates)
    {
        os << "\t==== Reads in plate No. " << plate << " ====\n";
        os << "  ";
        for(int col = 1; col <= PLATE_COLUMNS; ++col)
        {
            os << ' ' << std::setw(static_cast<int>(width)) << (col < 10 ? "0" + std::to_string(col) : std::to_string(col));
        }
        os << "\n";
        for(int row = 0; row < PLATE_ROWS; ++row)
        {
            os << char('A' + row) << ' ';
            for(int col = 1; col <= PLATE_COLUMNS; ++col)
            {
                Well well{plate, char('A' + row), col};
                os << ' ' << std::setw(static_cast<int>(width)) << get_count(well);
            }
            os << "\n";
        }
    }

    std::vector<Well> emptyWells = get_empty_wells();
    os << "Empty cells : [";
    for(size_t i = 0; i < emptyWells.size(); ++i)
    {
        if(i){os << ", ";}
        os << emptyWells.at(i).code();
    }
    os << "]\n";
    os << "empty cells : " << emptyWells.size() << " out of " << readsPerWell.size() << "\n";
    os << "discarded read pairs : " << discarded << " out of " << total << "\n";
}

void OccupancyReport::write(const std::string& directory, const std::string& prefix) const
{
    std::string occupancyFile = "occupancy.txt";
    if(prefix != "")
    {
        occupancyFile = prefix + '_' + occupancyFile;
    }
    std::filesystem::create_directories(directory);
    std::string occupancyPath = (std::filesystem::path(directory) / occupancyFile).string();

    std::ofstream out(occupancyPath);
    if (!out) {
        throw StageError("Could not open occupancy report for writing: " + occupancyPath);
    }
    write(out);
    out.close();
}
