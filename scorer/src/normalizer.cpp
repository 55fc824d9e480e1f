#include "normalizer.hpp"
#include <stdexcept>

namespace {

const std::array<PercentileBucket, ScoreNormalizer::kBucketCount> kLpBuckets = {{
    {0, 1, 150}, {1, 5, 250}, {5, 10, 350}, {10, 25, 450}, {25, 50, 550},
    {50, 75, 650}, {75, 90, 750}, {90, 95, 850}, {95, 99, 950}, {99, 100, 1000}
}};

const std::array<PercentileBucket, ScoreNormalizer::kBucketCount> kSwapBuckets = {{
    {0, 1, 150}, {1, 5, 250}, {5, 10, 350}, {10, 25, 450}, {25, 50, 550},
    {50, 75, 650}, {75, 90, 800}, {90, 95, 900}, {95, 99, 950}, {99, 100, 1000}
}};

} // namespace

const std::array<PercentileBucket, ScoreNormalizer::kBucketCount>&
ScoreNormalizer::buckets(ScoreType type) {
    return type == ScoreType::LP ? kLpBuckets : kSwapBuckets;
}

int ScoreNormalizer::normalize(double percentile, ScoreType type) {
    const auto& table = buckets(type);
    for (const auto& bucket : table) {
        if (bucket.lower <= percentile && percentile < bucket.upper) {
            return bucket.score;
        }
    }

    // 100 and above, or anything that slipped past the table edges
    if (percentile >= kTopPercentile) {
        return table.back().score;
    }

    return 0;
}

ScoreType ScoreNormalizer::parse_score_type(const std::string& name) {
    if (name == "lp_score") return ScoreType::LP;
    if (name == "swap_score") return ScoreType::Swap;
    throw std::invalid_argument("Unknown score type: " + name);
}
