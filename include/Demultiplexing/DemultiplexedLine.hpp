#pragma once

#include <string>
#include <vector>
#include <utility>
#include <iterator>
#include <cctype>

/// one fastq record, name is the header without the leading '@'
struct fastqLine
{
    std::string line;
    std::string quality = "";
    std::string name = "";
};

//forward and reverse record of a read pair
typedef std::pair<fastqLine, fastqLine> ReadPair;

/// the trailing token of a read header after upstream tag trimming (cutadapt -y ' {name}'),
/// a header without whitespace is its own suffix
inline std::string barcode_suffix(const std::string& header)
{
    size_t end = header.size();
    while(end > 0 && std::isspace(static_cast<unsigned char>(header[end - 1]))){--end;}

    size_t start = end;
    while(start > 0 && !std::isspace(static_cast<unsigned char>(header[start - 1]))){--start;}

    return header.substr(start, end - start);
}

/** @brief all read pairs assigned to one well, the order of pairs follows the input order
**/
class DemultiplexedReads
{
    public:

        DemultiplexedReads() = default;
        DemultiplexedReads(size_t readNum)
        {
            lineBatch.reserve(readNum);
        }

        void store_demultiplexed_read(const ReadPair& line)
        {
            lineBatch.push_back(line);
        }

        void append(DemultiplexedReads&& other)
        {
            lineBatch.insert(lineBatch.end(),
                             std::make_move_iterator(other.lineBatch.begin()),
                             std::make_move_iterator(other.lineBatch.end()));
            other.lineBatch.clear();
        }

        size_t size() const
        {
            return lineBatch.size();
        }

        bool empty() const
        {
            return lineBatch.empty();
        }

        const ReadPair& at(const size_t& i) const
        {
            return(lineBatch.at(i));
        }
        const std::vector<ReadPair>& get_all_reads() const
        {
            return(lineBatch);
        }

    private:
        std::vector<ReadPair> lineBatch;
};
