// ============================================================================
// QUORUM SCAN ENGINE - Signal Aggregator Implementation
// ============================================================================

#include "quorum/strategy/signal_aggregator.hpp"

#include <algorithm>

namespace quorum::strategy {

AggregateResult SignalAggregator::aggregate(std::span<const Candle> candles,
                                            std::span<const Voter> voters) const {
    std::vector<Ballot> ballots;
    ballots.reserve(voters.size());

    for (const auto& voter : voters) {
        ballots.push_back(Ballot{voter.id, voter.kind(), cast_vote(candles, voter.params),
                                 voter.weight});
    }

    return combine(std::move(ballots));
}

AggregateResult SignalAggregator::combine(std::vector<Ballot> ballots) const {
    AggregateResult result;
    result.ballots = std::move(ballots);

    double weighted_sum = 0.0;
    double total_weight = 0.0;
    size_t participating = 0;
    for (const auto& ballot : result.ballots) {
        if (ballot.weight <= 0.0) continue;
        weighted_sum += to_int(ballot.vote) * ballot.weight;
        total_weight += ballot.weight;
        ++participating;
    }

    // No enabled voters: Hold with zero score and confidence
    if (total_weight <= 0.0) {
        return result;
    }

    result.score = std::clamp(weighted_sum / total_weight, -1.0, 1.0);
    result.decision = decide(result.score);

    // Share of weighted ballots that agree; zero-weight ballots take no part
    if (result.decision != Decision::Hold) {
        const auto agreeing = std::count_if(
            result.ballots.begin(), result.ballots.end(),
            [&](const Ballot& b) { return b.weight > 0.0 && b.vote == result.decision; });
        result.confidence =
            static_cast<double>(agreeing) / static_cast<double>(participating);
    }

    return result;
}

}  // namespace quorum::strategy
