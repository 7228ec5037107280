#pragma once

#include <string>
#include <vector>
#include <utility>
#include <istream>
#include <memory>

#include "HomologyHit.hpp"
#include "helper.hpp"

//name (without '>') and sequence of one fasta record
typedef std::pair<std::string, std::string> FastaRecord;

//all records of a fasta file, sequences spanning several lines are joined. A missing file is a StageError
std::vector<FastaRecord> read_fasta_file(const std::string& path);
void write_fasta_file(const std::string& path, const std::vector<FastaRecord>& records);

//one line of blastn -outfmt 10 (columns of BLAST_HEADER), throws StageError for malformed lines
HomologyHit parse_blast_line(const std::string& line, unsigned long long lineNo);
//all rows of a blast csv, empty lines are skipped. An empty stream is a valid result without hits
std::vector<HomologyHit> parse_blast_csv(std::istream& in);

/** @brief searches every sequence of a query fasta file against a reference database
**/
class HomologySearch
{
    public:
        virtual ~HomologySearch() = default;

        //one QueryHits per fasta record in file order, records without hits have empty hit lists
        virtual HomologyResultSet search(const std::string& queryFasta) = 0;
};
typedef std::shared_ptr<HomologySearch> HomologySearchPtr;

/** @brief HomologySearch running blastn per contig
 * @details each record is written to <queryFasta>.<index>.fa, searched with
 * blastn -query <fa> -outfmt 10 -out <queryFasta>.<index>.csv <params> and parsed.
 * Different query files can be searched concurrently.
**/
class BlastnSearch : public HomologySearch
{
    public:
        BlastnSearch(const std::string& executable, const std::string& params, const std::string& logFile)
        : executable(executable), params(splitByWhitespace(params)), logFile(logFile)
        {}

        HomologyResultSet search(const std::string& queryFasta) override;

    private:
        std::string executable;
        std::vector<std::string> params;
        std::string logFile;
};
