#pragma once

#include <array>
#include <string>

enum class ScoreType {
    LP,
    Swap
};

// Half-open percentile range [lower, upper) and the score it maps to
struct PercentileBucket {
    double lower;
    double upper;
    int score;
};

// Maps a percentile rank (0-100) of a wallet within the population to a
// bounded score. Needs population statistics to produce that rank, so the
// scoring engine does not call it.
class ScoreNormalizer {
public:
    static constexpr size_t kBucketCount = 10;
    static constexpr double kTopPercentile = 99.0;

    static int normalize(double percentile, ScoreType type);

    // Throws std::invalid_argument for anything but "lp_score" / "swap_score"
    static ScoreType parse_score_type(const std::string& name);

    static const std::array<PercentileBucket, kBucketCount>& buckets(ScoreType type);
};
