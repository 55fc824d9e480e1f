#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/types.hpp"
#include "test_helpers.hpp"
#include <cstdint>
#include <limits>

using Catch::Matchers::ContainsSubstring;
using test::kDay0;
using test::message_json;
using test::tx_json;

TEST_CASE("Wallet activity decoding", "[types]") {
    SECTION("Valid message with optional metadata") {
        auto tx = tx_json("swap", kDay0);
        tx["document_id"] = "doc-1";
        tx["poolId"] = "pool-1";
        tx["poolName"] = "ETH/USDC";
        tx["tokenIn"] = {{"symbol", "ETH"}};
        tx["tokenOut"] = nullptr;
        tx["amount"] = "12.500000000000000001";
        tx["block_number"] = 17000000;
        tx["unknown_field"] = true;

        auto wallet = WalletActivity::from_json(message_json("0xabc", "dexes", nlohmann::json::array({tx})));

        REQUIRE(wallet.wallet_address == "0xabc");
        REQUIRE(wallet.data.size() == 1);
        REQUIRE(wallet.data[0].protocol_type == "dexes");

        const auto& decoded = wallet.data[0].transactions.at(0);
        REQUIRE(decoded.action == "swap");
        REQUIRE(decoded.timestamp == kDay0);
        REQUIRE(decoded.pool_name == std::optional<std::string>("ETH/USDC"));
        REQUIRE(decoded.token_in.has_value());
        REQUIRE_FALSE(decoded.token_out.has_value());
        REQUIRE(decoded.amount == std::optional<std::string>("12.500000000000000001"));
        REQUIRE(decoded.block_number == std::optional<int64_t>(17000000));
        REQUIRE_FALSE(decoded.token_address.has_value());
    }

    SECTION("Missing wallet_address") {
        nlohmann::json doc = {{"data", nlohmann::json::array()}};
        REQUIRE_THROWS_WITH(WalletActivity::from_json(doc),
                            ContainsSubstring("wallet_address") &&
                            ContainsSubstring("field required"));
    }

    SECTION("Wrong type for wallet_address") {
        nlohmann::json doc = {{"wallet_address", 42}, {"data", nlohmann::json::array()}};
        REQUIRE_THROWS_AS(WalletActivity::from_json(doc), SchemaValidationError);
    }

    SECTION("Data must be an array") {
        nlohmann::json doc = {{"wallet_address", "0x1"}, {"data", "dexes"}};
        REQUIRE_THROWS_WITH(WalletActivity::from_json(doc), ContainsSubstring("expected array"));
    }

    SECTION("Error path names the offending transaction field") {
        auto bad = tx_json("swap", kDay0);
        bad["timestamp"] = "yesterday";
        auto doc = message_json("0x1", "dexes", nlohmann::json::array({tx_json("swap", kDay0), bad}));

        REQUIRE_THROWS_WITH(WalletActivity::from_json(doc),
                            ContainsSubstring("data[0].transactions[1].timestamp") &&
                            ContainsSubstring("expected integer"));
    }

    SECTION("Fractional timestamps are rejected") {
        auto bad = tx_json("swap", kDay0);
        bad["timestamp"] = 1672531200.5;
        REQUIRE_THROWS_AS(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({bad}))),
                          SchemaValidationError);
    }

    SECTION("Integers beyond int64 are rejected, not wrapped") {
        auto bad = tx_json("swap", kDay0);
        bad["timestamp"] = std::numeric_limits<uint64_t>::max();
        REQUIRE_THROWS_WITH(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({bad}))),
                            ContainsSubstring("timestamp") && ContainsSubstring("out of range"));

        auto tx = tx_json("swap", kDay0);
        tx["block_number"] = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
        REQUIRE_THROWS_WITH(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))),
                            ContainsSubstring("block_number"));

        tx["block_number"] = std::numeric_limits<int64_t>::max();
        auto wallet = WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx})));
        REQUIRE(wallet.data[0].transactions[0].block_number ==
                std::optional<int64_t>(std::numeric_limits<int64_t>::max()));
    }

    SECTION("Required transaction fields") {
        for (const char* field : {"action", "timestamp", "caller", "protocol"}) {
            auto bad = tx_json("swap", kDay0);
            bad.erase(field);
            REQUIRE_THROWS_WITH(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({bad}))),
                                ContainsSubstring(field));
        }
    }

    SECTION("Amount limits") {
        auto tx = tx_json("swap", kDay0);

        tx["amount"] = 1.5;
        REQUIRE_NOTHROW(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))));

        tx["amount"] = "0.0000000000000000001";  // 19 places
        REQUIRE_THROWS_WITH(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))),
                            ContainsSubstring("18 decimal places"));

        tx["amount"] = "123456789012345678901.123456789012345678";  // 39 digits
        REQUIRE_THROWS_WITH(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))),
                            ContainsSubstring("38 digits"));

        tx["amount"] = "1e9223372036854775807";
        REQUIRE_THROWS_WITH(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))),
                            ContainsSubstring("38 digits"));

        tx["amount"] = "1.5e-9223372036854775808";
        REQUIRE_THROWS_WITH(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))),
                            ContainsSubstring("18 decimal places"));

        tx["amount"] = "1e99999999999999999999";
        REQUIRE_THROWS_AS(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))),
                          SchemaValidationError);

        tx["amount"] = "1.5e3";
        REQUIRE_NOTHROW(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))));

        tx["amount"] = "12abc";
        REQUIRE_THROWS_AS(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))),
                          SchemaValidationError);

        tx["amount"] = true;
        REQUIRE_THROWS_AS(WalletActivity::from_json(message_json("0x1", "dexes", nlohmann::json::array({tx}))),
                          SchemaValidationError);
    }

    SECTION("Payload that is not JSON") {
        REQUIRE_THROWS_WITH(parse_payload("{not json"), ContainsSubstring("invalid JSON"));
        REQUIRE_THROWS_AS(parse_payload(""), SchemaValidationError);
    }

    SECTION("Best-known wallet address") {
        REQUIRE(best_known_wallet({{"wallet_address", "0xdef"}}) == "0xdef");
        REQUIRE(best_known_wallet({{"wallet_address", 7}}) == "N/A");
        REQUIRE(best_known_wallet(nlohmann::json::array()) == "N/A");
    }

    SECTION("Protocol lookup") {
        auto wallet = WalletActivity::from_json(message_json("0x1", "lending", nlohmann::json::array()));
        REQUIRE(wallet.find_protocol("lending") != nullptr);
        REQUIRE(wallet.find_protocol("dexes") == nullptr);
    }
}

TEST_CASE("Output envelopes", "[types]") {
    SECTION("Success envelope shape") {
        CategoryScore category;
        category.category = "dexes";
        category.score = 480.0;
        category.transaction_count = 10;
        category.features.lp_score = 400.0;
        category.features.swap_score = 600.0;
        category.features.active_days = 9;
        category.features.total_transaction_count = 10;
        category.features.user_tags = {"consistent_lp", "consistent_trader"};

        SuccessEnvelope envelope;
        envelope.wallet_address = "0x123";
        envelope.zscore = "480.000000000000000000";
        envelope.timestamp = 1700000000;
        envelope.categories.push_back(category);

        auto j = envelope.to_json();
        REQUIRE(j["wallet_address"] == "0x123");
        REQUIRE(j["zscore"] == "480.000000000000000000");
        REQUIRE(j["timestamp"] == 1700000000);
        REQUIRE(j["categories"].size() == 1);

        const auto& c = j["categories"][0];
        REQUIRE(c["category"] == "dexes");
        REQUIRE(c["score"] == 480.0);
        REQUIRE(c["transaction_count"] == 10);
        REQUIRE(c["features"]["active_days"] == 9);
        REQUIRE(c["features"]["lp_score"] == 400.0);
        REQUIRE(c["features"]["swap_score"] == 600.0);
        REQUIRE(c["features"]["total_transaction_count"] == 10);
        REQUIRE(c["features"]["user_tags"] ==
                nlohmann::json::array({"consistent_lp", "consistent_trader"}));
    }

    SECTION("Empty categories serialize as an array") {
        SuccessEnvelope envelope;
        envelope.wallet_address = "0x1";
        envelope.zscore = "0.000000000000000000";
        REQUIRE(envelope.to_json()["categories"].is_array());
        REQUIRE(envelope.to_json()["categories"].empty());
    }

    SECTION("Failure envelope shape") {
        FailureEnvelope envelope{"N/A", 1700000000, "validation error"};
        auto j = envelope.to_json();
        REQUIRE(j.size() == 3);
        REQUIRE(j["wallet_address"] == "N/A");
        REQUIRE(j["timestamp"] == 1700000000);
        REQUIRE(j["error"] == "validation error");
    }
}
