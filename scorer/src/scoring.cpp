#include "scoring.hpp"
#include "util.hpp"
#include <algorithm>
#include <set>

ReputationScorer::ReputationScorer(const ScoringConfig& config)
    : config_(config) {}

std::optional<ScoreResult> ReputationScorer::score(const WalletActivity& activity) const {
    const ProtocolActivity* dex = activity.find_protocol(kDexProtocolType);
    if (!dex) {
        return std::nullopt;
    }
    return score_transactions(dex->transactions);
}

ScoreResult ReputationScorer::score_transactions(
        const std::vector<Transaction>& transactions) const {
    ScoreResult result;
    ScoreFeatures& features = result.features;

    features.total_transaction_count = static_cast<int64_t>(transactions.size());
    features.active_days = count_active_days(transactions);

    int64_t lp_count = 0;
    int64_t swap_count = 0;
    for (const auto& tx : transactions) {
        if (is_liquidity_action(tx.action)) {
            ++lp_count;
        } else if (is_swap_action(tx.action)) {
            ++swap_count;
        }
    }

    // Direct magnitude; see ScoreNormalizer for the percentile-bucket scheme
    features.lp_score = static_cast<double>(lp_count) * kPerTransactionScore;
    features.swap_score = static_cast<double>(swap_count) * kPerTransactionScore;

    if (lp_count > 0) {
        add_tag(features.user_tags, tags::kConsistentLp);
    }
    if (swap_count > 0) {
        add_tag(features.user_tags, tags::kConsistentTrader);
    }

    if (features.lp_score > 0 && features.swap_score > 0) {
        result.final_score = features.lp_score * config_.lp_weight +
                             features.swap_score * config_.swap_weight;
    } else if (features.lp_score > 0) {
        result.final_score = features.lp_score;
    } else if (features.swap_score > 0) {
        result.final_score = features.swap_score;
    } else {
        result.final_score = 0.0;
        add_tag(features.user_tags, tags::kInactive);
    }

    return result;
}

int64_t ReputationScorer::count_active_days(const std::vector<Transaction>& transactions) {
    std::set<int64_t> days;
    for (const auto& tx : transactions) {
        days.insert(util::utc_day(tx.timestamp));
    }
    return static_cast<int64_t>(days.size());
}

bool ReputationScorer::is_liquidity_action(const std::string& action) {
    return action == "add_liquidity" || action == "remove_liquidity";
}

bool ReputationScorer::is_swap_action(const std::string& action) {
    return action == "swap";
}

void ReputationScorer::add_tag(std::vector<std::string>& user_tags, const std::string& tag) {
    if (std::find(user_tags.begin(), user_tags.end(), tag) == user_tags.end()) {
        user_tags.push_back(tag);
    }
}
