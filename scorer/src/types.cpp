#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace {

constexpr int kAmountMaxDigits = 38;
constexpr int kAmountMaxDecimals = 18;

[[noreturn]] void fail(const std::string& path, const std::string& reason) {
    throw SchemaValidationError(path + ": " + reason);
}

const nlohmann::json& require(const nlohmann::json& j, const char* key,
                              const std::string& path) {
    auto it = j.find(key);
    if (it == j.end()) {
        fail(path + "." + key, "field required");
    }
    return *it;
}

std::string require_string(const nlohmann::json& j, const char* key,
                           const std::string& path) {
    const auto& v = require(j, key, path);
    if (!v.is_string()) {
        fail(path + "." + key, "expected string");
    }
    return v.get<std::string>();
}

// Non-negative literals are stored unsigned and may not fit int64_t
int64_t integer_value(const nlohmann::json& v, const std::string& path) {
    if (!v.is_number_integer()) {
        fail(path, "expected integer");
    }
    if (v.is_number_unsigned() &&
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        fail(path, "integer out of range");
    }
    return v.get<int64_t>();
}

int64_t require_integer(const nlohmann::json& j, const char* key,
                        const std::string& path) {
    return integer_value(require(j, key, path), path + "." + key);
}

// Absent and null both mean "not provided"
const nlohmann::json* optional_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key,
                                           const std::string& path) {
    const auto* v = optional_field(j, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) {
        fail(path + "." + key, "expected string");
    }
    return v->get<std::string>();
}

std::optional<nlohmann::json> optional_object(const nlohmann::json& j, const char* key,
                                              const std::string& path) {
    const auto* v = optional_field(j, key);
    if (!v) return std::nullopt;
    if (!v->is_object()) {
        fail(path + "." + key, "expected object");
    }
    return *v;
}

// Digit/decimal-place limits follow the usual Decimal(38, 18) column rules:
// digits = max(significant digits, fractional digits)
void check_decimal_text(const std::string& text, const std::string& path) {
    size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;

    std::string mantissa;
    long fraction_digits = 0;
    bool seen_point = false;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            mantissa.push_back(c);
            if (seen_point) ++fraction_digits;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }
    if (mantissa.empty()) {
        fail(path, "expected decimal");
    }

    long exponent = 0;
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        std::string exp_text = text.substr(i + 1);
        if (exp_text.empty()) {
            fail(path, "expected decimal");
        }
        size_t consumed = 0;
        try {
            exponent = std::stol(exp_text, &consumed);
        } catch (const std::exception&) {
            fail(path, "expected decimal");
        }
        if (consumed != exp_text.size()) {
            fail(path, "expected decimal");
        }
        // Bounded before any arithmetic on it
        if (exponent > kAmountMaxDigits + kAmountMaxDecimals) {
            fail(path, "ensure that there are no more than 38 digits in total");
        }
        if (exponent < -(kAmountMaxDigits + kAmountMaxDecimals)) {
            fail(path, "ensure that there are no more than 18 decimal places");
        }
        i = text.size();
    }
    if (i != text.size()) {
        fail(path, "expected decimal");
    }

    auto first_nonzero = mantissa.find_first_not_of('0');
    long significant = first_nonzero == std::string::npos
        ? 1 : static_cast<long>(mantissa.size() - first_nonzero);
    long scale = exponent - fraction_digits;

    long digits = 0;
    long decimals = 0;
    if (scale >= 0) {
        digits = significant + scale;
    } else {
        decimals = -scale;
        digits = std::max(significant, decimals);
    }

    if (digits > kAmountMaxDigits) {
        fail(path, "ensure that there are no more than 38 digits in total");
    }
    if (decimals > kAmountMaxDecimals) {
        fail(path, "ensure that there are no more than 18 decimal places");
    }
}

std::optional<std::string> optional_amount(const nlohmann::json& j, const std::string& path) {
    const auto* v = optional_field(j, "amount");
    if (!v) return std::nullopt;

    std::string text;
    if (v->is_string()) {
        text = v->get<std::string>();
    } else if (v->is_number()) {
        text = v->dump();
    } else {
        fail(path + ".amount", "expected decimal");
    }
    check_decimal_text(text, path + ".amount");
    return text;
}

} // namespace

Transaction Transaction::from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        fail(path, "expected object");
    }

    Transaction tx;
    tx.action = require_string(j, "action", path);
    tx.timestamp = require_integer(j, "timestamp", path);
    tx.caller = require_string(j, "caller", path);
    tx.protocol = require_string(j, "protocol", path);

    tx.document_id = optional_string(j, "document_id", path);
    tx.pool_id = optional_string(j, "poolId", path);
    tx.pool_name = optional_string(j, "poolName", path);
    tx.token_in = optional_object(j, "tokenIn", path);
    tx.token_out = optional_object(j, "tokenOut", path);
    tx.token_address = optional_string(j, "token_address", path);
    tx.amount = optional_amount(j, path);

    if (const auto* bn = optional_field(j, "block_number")) {
        tx.block_number = integer_value(*bn, path + ".block_number");
    }

    return tx;
}

ProtocolActivity ProtocolActivity::from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        fail(path, "expected object");
    }

    ProtocolActivity activity;
    activity.protocol_type = require_string(j, "protocolType", path);

    const auto& txs = require(j, "transactions", path);
    if (!txs.is_array()) {
        fail(path + ".transactions", "expected array");
    }
    activity.transactions.reserve(txs.size());
    for (size_t i = 0; i < txs.size(); ++i) {
        activity.transactions.push_back(
            Transaction::from_json(txs[i], path + ".transactions[" + std::to_string(i) + "]"));
    }
    return activity;
}

WalletActivity WalletActivity::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        fail("message", "expected object");
    }

    WalletActivity activity;
    activity.wallet_address = require_string(j, "wallet_address", "message");

    const auto& data = require(j, "data", "message");
    if (!data.is_array()) {
        fail("data", "expected array");
    }
    activity.data.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        activity.data.push_back(
            ProtocolActivity::from_json(data[i], "data[" + std::to_string(i) + "]"));
    }
    return activity;
}


const ProtocolActivity* WalletActivity::find_protocol(const std::string& protocol_type) const {
    auto it = std::find_if(data.begin(), data.end(),
        [&](const ProtocolActivity& p) { return p.protocol_type == protocol_type; });
    return it == data.end() ? nullptr : &*it;
}

bool ScoreFeatures::has_tag(const std::string& tag) const {
    return std::find(user_tags.begin(), user_tags.end(), tag) != user_tags.end();
}

nlohmann::json ScoreFeatures::to_json() const {
    return {
        {"active_days", active_days},
        {"lp_score", lp_score},
        {"swap_score", swap_score},
        {"total_transaction_count", total_transaction_count},
        {"user_tags", user_tags}
    };
}

nlohmann::json CategoryScore::to_json() const {
    return {
        {"category", category},
        {"score", score},
        {"transaction_count", transaction_count},
        {"features", features.to_json()}
    };
}

nlohmann::json SuccessEnvelope::to_json() const {
    nlohmann::json cats = nlohmann::json::array();
    for (const auto& c : categories) {
        cats.push_back(c.to_json());
    }

    return {
        {"wallet_address", wallet_address},
        {"zscore", zscore},
        {"timestamp", timestamp},
        {"categories", cats}
    };
}

nlohmann::json FailureEnvelope::to_json() const {
    return {
        {"wallet_address", wallet_address},
        {"timestamp", timestamp},
        {"error", error}
    };
}

nlohmann::json parse_payload(const std::string& payload) {
    try {
        return nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw SchemaValidationError(std::string("invalid JSON: ") + e.what());
    }
}

std::string best_known_wallet(const nlohmann::json& j) {
    if (j.is_object()) {
        auto it = j.find("wallet_address");
        if (it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "N/A";
}
