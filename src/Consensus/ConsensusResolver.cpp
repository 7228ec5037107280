#include "ConsensusResolver.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <tuple>

#include "helper.hpp"

namespace
{

//sorted unique values joined by ':', already joined values are split first
std::string join_unique(const std::vector<std::string>& joined)
{
    std::vector<std::string> values;
    for(const std::string& value : joined)
    {
        for(const std::string& part : splitByDelimiter(value, ":"))
        {
            if(!part.empty()){values.push_back(part);}
        }
    }
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return joinStrings(values, ":");
}

std::set<std::string> subject_accessions(const ConsensusCall& call)
{
    std::set<std::string> accessions;
    for(const HomologyHit& hit : call.hits)
    {
        accessions.insert(hit.subjectAccession);
    }
    return accessions;
}

//total order over hit rows, the leading keys rank, the rest only makes the order independent of the input order
bool ranks_before(const HomologyHit& a, const HomologyHit& b)
{
    if(a.evalue != b.evalue){return a.evalue < b.evalue;}
    if(a.bitscore != b.bitscore){return a.bitscore > b.bitscore;}
    if(a.subjectAccession != b.subjectAccession){return a.subjectAccession < b.subjectAccession;}
    if(a.percentIdentity != b.percentIdentity){return a.percentIdentity > b.percentIdentity;}
    return std::tie(a.queryFile, a.queryName, a.querySeq, a.queryAccession, a.length, a.queryStart, a.subjectStart)
         < std::tie(b.queryFile, b.queryName, b.querySeq, b.queryAccession, b.length, b.queryStart, b.subjectStart);
}

}

std::vector<HomologyHit> choose_highest_score(const QueryHits& query)
{
    std::vector<HomologyHit> winners;
    if(query.hits.empty())
    {
        return winners;
    }

    double minEvalue = query.hits.front().evalue;
    double maxBitscore = query.hits.front().bitscore;
    for(const HomologyHit& hit : query.hits)
    {
        minEvalue = std::min(minEvalue, hit.evalue);
        maxBitscore = std::max(maxBitscore, hit.bitscore);
    }

    for(const HomologyHit& hit : query.hits)
    {
        if(hit.evalue == minEvalue && hit.bitscore == maxBitscore)
        {
            winners.push_back(hit);
        }
    }
    return winners;
}

std::optional<ConsensusCall> resolve_single(const HomologyResultSet& resultSet)
{
    std::optional<ConsensusCall> best;
    for(const QueryHits& query : resultSet.queries)
    {
        std::vector<HomologyHit> winners = choose_highest_score(query);
        if(winners.empty())
        {
            continue;
        }
        //all winners share the same e-value, strict comparison keeps the first query on ties
        if(!best.has_value() || winners.front().evalue < best->top().evalue)
        {
            ConsensusCall call;
            call.hits = std::move(winners);
            call.queryFile = query.queryFile;
            call.queryName = query.queryName;
            call.querySeq = query.querySeq;
            call.fromIntersection = false;
            best = std::move(call);
        }
    }
    return best;
}

std::optional<ConsensusCall> intersect_calls(const std::vector<ConsensusCall>& calls)
{
    if(calls.empty())
    {
        return std::nullopt;
    }

    std::set<std::string> common = subject_accessions(calls.front());
    for(size_t i = 1; i < calls.size(); ++i)
    {
        std::set<std::string> accessions = subject_accessions(calls.at(i));
        std::set<std::string> remaining;
        std::set_intersection(common.begin(), common.end(), accessions.begin(), accessions.end(),
                              std::inserter(remaining, remaining.begin()));
        common = std::move(remaining);
    }
    if(common.empty())
    {
        return std::nullopt;
    }

    std::vector<HomologyHit> rows;
    std::vector<std::string> queryFiles, queryNames, querySeqs;
    for(const ConsensusCall& call : calls)
    {
        for(const HomologyHit& hit : call.hits)
        {
            if(common.count(hit.subjectAccession)){rows.push_back(hit);}
        }
        queryFiles.push_back(call.queryFile);
        queryNames.push_back(call.queryName);
        querySeqs.push_back(call.querySeq);
    }
    std::sort(rows.begin(), rows.end(), ranks_before);

    //one row per accession, the best ranked one
    ConsensusCall consensus;
    std::set<std::string> taken;
    for(HomologyHit& hit : rows)
    {
        if(taken.insert(hit.subjectAccession).second)
        {
            consensus.hits.push_back(std::move(hit));
        }
    }
    consensus.queryFile = join_unique(queryFiles);
    consensus.queryName = join_unique(queryNames);
    consensus.querySeq = join_unique(querySeqs);
    consensus.fromIntersection = true;

    return consensus;
}

std::optional<ConsensusCall> best_hit_table(const HomologyResultSet& resultSet)
{
    ConsensusCall table;
    std::vector<std::string> queryFiles, queryNames, querySeqs;
    for(const QueryHits& query : resultSet.queries)
    {
        std::vector<HomologyHit> winners = choose_highest_score(query);
        if(winners.empty())
        {
            continue;
        }
        table.hits.insert(table.hits.end(), winners.begin(), winners.end());
        queryFiles.push_back(query.queryFile);
        queryNames.push_back(query.queryName);
        querySeqs.push_back(query.querySeq);
    }
    if(table.hits.empty())
    {
        return std::nullopt;
    }
    table.queryFile = join_unique(queryFiles);
    table.queryName = join_unique(queryNames);
    table.querySeq = join_unique(querySeqs);
    return table;
}

std::optional<ConsensusCall> resolve_multi(const std::vector<HomologyResultSet>& resultSets)
{
    std::vector<ConsensusCall> calls;
    std::vector<ConsensusCall> tables;
    for(const HomologyResultSet& resultSet : resultSets)
    {
        std::optional<ConsensusCall> call = resolve_single(resultSet);
        if(!call.has_value())
        {
            continue;
        }
        calls.push_back(std::move(call.value()));
        //a set with a call always has winners
        tables.push_back(best_hit_table(resultSet).value());
    }

    if(calls.empty())
    {
        return std::nullopt;
    }
    if(calls.size() == 1)
    {
        return calls.front();
    }
    return intersect_calls(tables);
}
