#include <engram/memory/ranking.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>

namespace engram {

double combine_score(const RankingSignals& signals) {
    return RELEVANCE_WEIGHT * signals.relevance
         + RECENCY_WEIGHT * signals.recency
         + OUTCOME_WEIGHT * signals.outcome
         + signals.scope_bonus;
}

double recency_signal(int64_t created_at_ms, int64_t now_ms) {
    double days = static_cast<double>(now_ms - created_at_ms) / static_cast<double>(MS_PER_DAY);
    if (days < 0.0) days = 0.0;
    return 1.0 / (1.0 + days);
}

double outcome_signal(bool success) {
    return success ? 1.0 : 0.5;
}

double scope_bonus(const std::string& candidate_project, const std::string& requested_project) {
    if (requested_project.empty()) return 0.0;
    return candidate_project == requested_project ? SCOPE_BONUS : 0.0;
}

RankingSignals signals_for(const Experience& e, double relevance,
                           const std::string& requested_project, int64_t now_ms) {
    RankingSignals s;
    s.relevance = relevance;
    s.recency = recency_signal(e.created_at, now_ms);
    s.outcome = outcome_signal(e.success);
    s.scope_bonus = scope_bonus(e.project, requested_project);
    return s;
}

void rank_hits(std::vector<ScoredExperience>& hits,
               const std::string& requested_project, int64_t now_ms) {
    for (size_t i = 0; i < hits.size(); ++i) {
        hits[i].score = combine_score(
            signals_for(hits[i].entry, hits[i].relevance, requested_project, now_ms));
    }
    
    std::sort(hits.begin(), hits.end(),
        [](const ScoredExperience& a, const ScoredExperience& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.entry.created_at != b.entry.created_at) {
                return a.entry.created_at > b.entry.created_at;
            }
            return a.entry.id > b.entry.id;
        });
}

} // namespace engram
