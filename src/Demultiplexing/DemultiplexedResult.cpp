#include "DemultiplexedResult.hpp"

#include <fstream>
#include <sstream>
#include <filesystem>
#include <stdexcept>

#include "FastqReader.hpp"

std::string well_fastq_name(const std::string& replicate, bool forward)
{
    return replicate + (forward ? "_R1.fastq" : "_R2.fastq");
}

const DemultiplexedReads& DemultiplexedResult::get_reads(const Well& well) const
{
    for(size_t i = 0; i < wells.size(); ++i)
    {
        if(wells.at(i) == well){return readsPerWell.at(i);}
    }
    throw std::out_of_range("Well " + well.code() + " is not part of the barcode table");
}

unsigned long long DemultiplexedResult::get_assigned() const
{
    unsigned long long assigned = 0;
    for(const DemultiplexedReads& reads : readsPerWell)
    {
        ullong_save_add(assigned, reads.size());
    }
    return assigned;
}

void DemultiplexedResult::write_wells(const std::string& cellsDir, const std::string& replicate) const
{
    for(size_t i = 0; i < wells.size(); ++i)
    {
        std::filesystem::path wellDir = std::filesystem::path(cellsDir) / wells.at(i).code();
        std::filesystem::create_directories(wellDir);

        const std::string fwFile = (wellDir / well_fastq_name(replicate, true)).string();
        const std::string rvFile = (wellDir / well_fastq_name(replicate, false)).string();
        std::ofstream fwStream(fwFile);
        std::ofstream rvStream(rvFile);
        if(!fwStream || !rvStream)
        {
            throw StageError("Could not open demultiplexed output files in " + wellDir.string());
        }

        //buffer the reads of a well before writing
        std::ostringstream fwBuffer;
        std::ostringstream rvBuffer;
        for(const ReadPair& pair : readsPerWell.at(i).get_all_reads())
        {
            write_fastq_line(fwBuffer, pair.first);
            write_fastq_line(rvBuffer, pair.second);
        }
        fwStream << fwBuffer.str();
        rvStream << rvBuffer.str();

        if(!fwStream || !rvStream)
        {
            throw StageError("Writing demultiplexed reads failed for well " + wells.at(i).code());
        }
    }
}
