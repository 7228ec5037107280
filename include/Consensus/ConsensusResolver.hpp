#pragma once

#include <vector>
#include <optional>

#include "HomologyHit.hpp"

/**
 * @brief all hits of a query with the minimal e-value AND the maximal bit-score of that query, in input order.
 * Ties are kept. The result can be empty if no row fulfills both conditions.
**/
std::vector<HomologyHit> choose_highest_score(const QueryHits& query);

/**
 * @brief best call of one ContigSet: the winners of the query with the smallest e-value,
 * the first query wins ties. No call if no query has winners.
**/
std::optional<ConsensusCall> resolve_single(const HomologyResultSet& resultSet);

/**
 * @brief best-hit table of one ContigSet: the winners of every query in query order
 * @details provenance fields hold the unique values of the contributing queries joined by ':'.
 * No table if no query has winners.
**/
std::optional<ConsensusCall> best_hit_table(const HomologyResultSet& resultSet);

/**
 * @brief agreement of several best-hit tables (one per ContigSet)
 * @details only subject accessions present in every call survive. Their rows are ranked by
 * (e-value asc, bit-score desc, accession, identity desc, provenance) and reduced to one row per accession.
 * An empty intersection is no call. The result does not depend on the order of the calls.
**/
std::optional<ConsensusCall> intersect_calls(const std::vector<ConsensusCall>& calls);

/**
 * @brief call of a well assembled from several replicates: resolve_single per set, sets without a call are dropped,
 * a single remaining call is returned as is. With several calls the best-hit tables of their sets are intersected.
**/
std::optional<ConsensusCall> resolve_multi(const std::vector<HomologyResultSet>& resultSets);
