#pragma once

#include <string>
#include <vector>
#include <functional>
#include <optional>
#include <ostream>

#include "HomologyHit.hpp"
#include "BarcodeTable.hpp"

/// one line of the final call report, one per well with a call
struct CallReportRow
{
    int plate = 0;
    std::string well;   //row and column of the well, e.g. A01
    std::string candidate;
    double percentIdentity = 0.0;
    unsigned long long length = 0;
    double evalue = 0.0;
    double bitscore = 0.0;
    std::string querySeq;
    std::string queryFile;
    std::string queryName;
    unsigned long long rawCount = 0;
    unsigned long long queryCount = 0;
    bool fromIntersection = false;
    std::vector<std::string> otherCandidates;
};

typedef std::function<bool(const CallReportRow&)> CallReportFilter;

//builds a row from the call of a well, rawCount are the read pairs of the well and
//queryCount the number of contigs that were searched
CallReportRow make_report_row(const Well& well, const ConsensusCall& call,
                              unsigned long long rawCount, unsigned long long queryCount);

/**
 * @brief parses a filter expression like "evalue<=1e-50 && pident>=97"
 * @details clauses are <column><op><value> joined by &&. Operators: < <= > >= == !=
 * Columns: plate well candidate pident length evalue bitscore raw_count query_count from_intersection.
 * Text columns (well, candidate) compare lexicographically, from_intersection takes true/false.
 * Unknown columns, operators or values throw a ConfigError.
**/
CallReportFilter parse_report_filter(const std::string& expression);

/** @brief the per-well calls of a run, sorted by plate and well
**/
class CallReport
{
    public:

        //wells without a call are skipped
        void add_call(const Well& well, const std::optional<ConsensusCall>& call,
                      unsigned long long rawCount, unsigned long long queryCount);
        void add_row(const CallReportRow& row);

        void sort_rows();
        //keeps only rows the predicate accepts
        void filter(const CallReportFilter& predicate);

        //csv with header, rows are sorted before writing
        void write(std::ostream& os);
        void write(const std::string& path);

        const std::vector<CallReportRow>& get_rows() const { return rows; }
        size_t size() const { return rows.size(); }

    private:
        std::vector<CallReportRow> rows;
};
