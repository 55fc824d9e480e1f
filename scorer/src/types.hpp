#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Input failed structural or type validation
class SchemaValidationError : public std::runtime_error {
public:
    explicit SchemaValidationError(const std::string& what)
        : std::runtime_error(what) {}
};

struct Transaction {
    std::string action;
    int64_t timestamp = 0;  // epoch seconds, UTC
    std::string caller;
    std::string protocol;

    // Metadata carried through validation, not read by scoring
    std::optional<std::string> document_id;
    std::optional<std::string> pool_id;
    std::optional<std::string> pool_name;
    std::optional<nlohmann::json> token_in;
    std::optional<nlohmann::json> token_out;
    std::optional<std::string> token_address;
    std::optional<std::string> amount;  // decimal text, <=38 digits, <=18 places
    std::optional<int64_t> block_number;

    static Transaction from_json(const nlohmann::json& j, const std::string& path);
};

struct ProtocolActivity {
    std::string protocol_type;
    std::vector<Transaction> transactions;

    static ProtocolActivity from_json(const nlohmann::json& j, const std::string& path);
};

struct WalletActivity {
    std::string wallet_address;
    std::vector<ProtocolActivity> data;

    // Throws SchemaValidationError
    static WalletActivity from_json(const nlohmann::json& j);

    const ProtocolActivity* find_protocol(const std::string& protocol_type) const;
};

struct ScoreFeatures {
    double lp_score = 0.0;
    double swap_score = 0.0;
    int64_t active_days = 0;
    int64_t total_transaction_count = 0;
    std::vector<std::string> user_tags;

    bool has_tag(const std::string& tag) const;
    nlohmann::json to_json() const;
};

struct ScoreResult {
    double final_score = 0.0;
    ScoreFeatures features;
};

struct CategoryScore {
    std::string category;
    double score = 0.0;
    int64_t transaction_count = 0;
    ScoreFeatures features;

    nlohmann::json to_json() const;
};

struct SuccessEnvelope {
    std::string wallet_address;
    std::string zscore;  // final score, 18 fractional digits
    int64_t timestamp = 0;
    std::vector<CategoryScore> categories;

    nlohmann::json to_json() const;
};

struct FailureEnvelope {
    std::string wallet_address;
    int64_t timestamp = 0;
    std::string error;

    nlohmann::json to_json() const;
};

// Raw message text to JSON; throws SchemaValidationError if it is not JSON
nlohmann::json parse_payload(const std::string& payload);

// wallet_address from a raw document when it is a string, else "N/A"
std::string best_known_wallet(const nlohmann::json& j);
