#pragma once

#include <string>
#include <vector>
#include <optional>

//column order of blastn -outfmt 10
inline const std::vector<std::string> BLAST_HEADER = {"qaccver", "saccver", "pident", "length", "mismatch", "gapopen",
                                                      "qstart", "qend", "sstart", "send", "evalue", "bitscore"};

/// one alignment row of a homology search plus the query it came from
struct HomologyHit
{
    std::string queryAccession;
    std::string subjectAccession;
    double percentIdentity = 0.0;
    unsigned long long length = 0;
    unsigned long long mismatches = 0;
    unsigned long long gapOpens = 0;
    unsigned long long queryStart = 0;
    unsigned long long queryEnd = 0;
    unsigned long long subjectStart = 0;
    unsigned long long subjectEnd = 0;
    double evalue = 0.0;
    double bitscore = 0.0;

    //provenance
    std::string queryFile;
    std::string queryName;
    std::string querySeq;
};

/// all hits of a single query sequence (one contig), hits can be empty
struct QueryHits
{
    std::string queryFile;
    std::string queryName;
    std::string querySeq;
    std::vector<HomologyHit> hits;
};

/// the search result of one ContigSet: one QueryHits per contig in contig order
struct HomologyResultSet
{
    std::string queryFile;
    std::vector<QueryHits> queries;

    size_t query_count() const { return queries.size(); }
};

/** @brief the accepted identification of a well
 * @details hits are ranked, the first row is the call, all further rows are alternatives
 * (e.g. subjects with identical e-value and bit-score). A missing call is an empty std::optional.
**/
struct ConsensusCall
{
    std::vector<HomologyHit> hits;
    std::string queryFile;
    std::string queryName;
    std::string querySeq;
    bool fromIntersection = false;

    const HomologyHit& top() const { return hits.front(); }

    //subject accessions of the lower ranked rows, unique and in rank order
    std::vector<std::string> other_candidates() const
    {
        std::vector<std::string> others;
        for(size_t i = 1; i < hits.size(); ++i)
        {
            const std::string& accession = hits.at(i).subjectAccession;
            if(accession == top().subjectAccession){continue;}
            bool seen = false;
            for(const std::string& other : others)
            {
                if(other == accession){seen = true; break;}
            }
            if(!seen){others.push_back(accession);}
        }
        return others;
    }
};
