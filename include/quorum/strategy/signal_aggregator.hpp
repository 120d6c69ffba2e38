#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Signal Aggregator
// ============================================================================
// score = sum(vote * weight) / sum(weight) over enabled voters only
// score > buy_threshold -> Buy, score < sell_threshold -> Sell, else Hold
// ============================================================================

#include "quorum/strategy/voters.hpp"
#include "quorum/core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace quorum::strategy {

/// One voter's contribution to an aggregate
struct Ballot {
    std::string voter_id;
    VoterKind kind = VoterKind::SmaCross;
    Vote vote = Vote::Hold;
    double weight = 0.0;
};

struct AggregateResult {
    std::vector<Ballot> ballots;
    double score = 0.0;                // Always within [-1, 1]
    Decision decision = Decision::Hold;
    double confidence = 0.0;           // Fraction of voters agreeing with a directional decision
};

struct AggregatorConfig {
    double buy_threshold = 0.3;
    double sell_threshold = -0.3;
};

class SignalAggregator {
public:
    explicit SignalAggregator(const AggregatorConfig& config = AggregatorConfig{})
        : config_(config) {}

    /// Run every voter over the window and combine
    [[nodiscard]] AggregateResult aggregate(std::span<const Candle> candles,
                                            std::span<const Voter> voters) const;

    /// Combine already-cast ballots
    [[nodiscard]] AggregateResult combine(std::vector<Ballot> ballots) const;

    [[nodiscard]] Decision decide(double score) const noexcept {
        if (score > config_.buy_threshold) return Decision::Buy;
        if (score < config_.sell_threshold) return Decision::Sell;
        return Decision::Hold;
    }

    [[nodiscard]] const AggregatorConfig& config() const noexcept { return config_; }

private:
    AggregatorConfig config_;
};

}  // namespace quorum::strategy
