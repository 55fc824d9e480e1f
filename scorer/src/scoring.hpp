#pragma once

#include "types.hpp"
#include <optional>
#include <string>

// Weights and activity thresholds for reputation scoring
struct ScoringConfig {
    double lp_weight = 0.6;
    double swap_weight = 0.4;

    // Configured but not enforced: tags depend only on presence of activity
    int lp_active_days_min = 15;
    int lp_min_tx_count = 5;
    int swap_active_days_min = 10;
    int swap_min_tx_count = 5;
};

namespace tags {
    inline const std::string kConsistentLp = "consistent_lp";
    inline const std::string kConsistentTrader = "consistent_trader";
    inline const std::string kInactive = "inactive";
}

inline const std::string kDexProtocolType = "dexes";
inline constexpr double kPerTransactionScore = 100.0;

class ReputationScorer {
public:
    explicit ReputationScorer(const ScoringConfig& config = ScoringConfig());

    // std::nullopt when the wallet has no "dexes" block (nothing to score),
    // which is distinct from a dexes block with no transactions
    std::optional<ScoreResult> score(const WalletActivity& activity) const;

    // Scores one DEX transaction list
    ScoreResult score_transactions(const std::vector<Transaction>& transactions) const;

    const ScoringConfig& config() const { return config_; }

private:
    ScoringConfig config_;

    static int64_t count_active_days(const std::vector<Transaction>& transactions);
    static bool is_liquidity_action(const std::string& action);
    static bool is_swap_action(const std::string& action);
    static void add_tag(std::vector<std::string>& user_tags, const std::string& tag);
};
