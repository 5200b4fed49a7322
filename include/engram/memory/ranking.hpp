/*
 * engram - Ranking
 *
 * Recall order is a weighted blend of four named signals:
 *
 *   score = 0.5 * relevance + 0.3 * recency + 0.2 * outcome + scope_bonus
 *
 *   relevance   - lexical match quality from the full-text index (higher = better)
 *   recency     - 1 / (1 + days since creation)
 *   outcome     - 1.0 for a success, 0.5 for a failure
 *   scope_bonus - 0.1 when the row belongs to the requested project
 *
 * Everything here is pure so it can be tested without a database.
 */
#ifndef engram_MEMORY_RANKING_HPP
#define engram_MEMORY_RANKING_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace engram {

const double RELEVANCE_WEIGHT = 0.5;
const double RECENCY_WEIGHT = 0.3;
const double OUTCOME_WEIGHT = 0.2;
const double SCOPE_BONUS = 0.1;

struct RankingSignals {
    double relevance;
    double recency;
    double outcome;
    double scope_bonus;
    
    RankingSignals() : relevance(0.0), recency(0.0), outcome(0.0), scope_bonus(0.0) {}
};

double combine_score(const RankingSignals& signals);

// Rows created "in the future" (clock skew) count as brand new
double recency_signal(int64_t created_at_ms, int64_t now_ms);

double outcome_signal(bool success);

// requested_project empty = global search, never a bonus
double scope_bonus(const std::string& candidate_project, const std::string& requested_project);

RankingSignals signals_for(const Experience& e, double relevance,
                           const std::string& requested_project, int64_t now_ms);

// Score every hit and sort: score desc, then created_at desc, then id desc
void rank_hits(std::vector<ScoredExperience>& hits,
               const std::string& requested_project, int64_t now_ms);

} // namespace engram

#endif // engram_MEMORY_RANKING_HPP
