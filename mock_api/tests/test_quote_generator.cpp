#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "engine/QuoteGenerator.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <regex>
#include <set>
#include <stdexcept>

using namespace mockapi;
using Catch::Approx;

namespace {

    void requireBand(const std::string& symbol, double lo, double hi) {
        QuoteGenerator gen;
        for (int i = 0; i < 500; ++i) {
            MarketQuote q = gen.generate(symbol);
            REQUIRE(q.price >= lo);
            REQUIRE(q.price <= hi);
        }
    }

} // namespace

// ============================================================
// Price bands
// ============================================================

TEST_CASE("QuoteGenerator: BTC prices stay within band", "[quote]") {
    requireBand("BTC-USD", 34500.0, 35500.0);
    requireBand("BTCUSDT", 34500.0, 35500.0);
}

TEST_CASE("QuoteGenerator: ETH, SOL and AAPL bands", "[quote]") {
    requireBand("ETH-USD", 2150.0, 2250.0);
    requireBand("SOL-USD", 75.0, 85.0);
    requireBand("AAPL", 173.0, 177.0);
}

TEST_CASE("QuoteGenerator: Unknown symbols use the default band", "[quote]") {
    requireBand("MSFT", 90.0, 110.0);
    requireBand("EUR-USD", 90.0, 110.0);
    requireBand("", 90.0, 110.0);
}

TEST_CASE("QuoteGenerator: Prefix match is case-sensitive", "[quote]") {
    // "btc" is not "BTC", falls through to the default profile
    requireBand("btc-usd", 90.0, 110.0);
}

// ============================================================
// Quote structure
// ============================================================

TEST_CASE("QuoteGenerator: Bid below price below ask", "[quote]") {
    QuoteGenerator gen;
    for (const char* symbol : { "BTC-USD", "ETH-USD", "SOL-USD", "AAPL", "XYZ" }) {
        for (int i = 0; i < 200; ++i) {
            MarketQuote q = gen.generate(symbol);
            REQUIRE(q.bid < q.price);
            REQUIRE(q.price < q.ask);
        }
    }
}

TEST_CASE("QuoteGenerator: Spread is 0.1% of price", "[quote]") {
    QuoteGenerator gen;
    for (int i = 0; i < 200; ++i) {
        MarketQuote q = gen.generate("BTC-USD");
        // price is the base rounded to the cent, which moves base * 0.001
        // by at most 0.000005
        REQUIRE(std::fabs((q.ask - q.bid) - q.price * 0.001) <= 0.01 + 1e-5);
    }
}

TEST_CASE("QuoteGenerator: Spread matches the base within a cent", "[quote]") {
    for (double base : { 35000.0, 2200.37, 123.456, 80.005, 99.999, 0.5 }) {
        ServerConfig::MarketDataParams params;
        params.profiles = { { "X", base, 0.0 } };

        QuoteGenerator gen(params);
        MarketQuote q = gen.generate("X");
        REQUIRE(std::fabs((q.ask - q.bid) - base * 0.001) <= 0.01 + 1e-9);
    }
}

TEST_CASE("QuoteGenerator: Volume within range", "[quote]") {
    QuoteGenerator gen;
    for (int i = 0; i < 500; ++i) {
        MarketQuote q = gen.generate("SOL-USD");
        REQUIRE(q.volume >= 1000.0);
        REQUIRE(q.volume <= 6000.0);
    }
}

TEST_CASE("QuoteGenerator: Values carry at most two decimals", "[quote]") {
    QuoteGenerator gen;
    for (int i = 0; i < 100; ++i) {
        MarketQuote q = gen.generate("ETH-USD");
        for (double v : { q.price, q.bid, q.ask, q.volume }) {
            REQUIRE(std::fabs(v * 100.0 - std::round(v * 100.0)) < 1e-6);
        }
    }
}

TEST_CASE("QuoteGenerator: Exchange is one of four venues", "[quote]") {
    const std::set<std::string> venues = { "Binance", "Coinbase", "Kraken", "FTX" };
    std::set<std::string> seen;

    QuoteGenerator gen;
    for (int i = 0; i < 400; ++i) {
        MarketQuote q = gen.generate("BTC-USD");
        REQUIRE(venues.count(q.exchange) == 1);
        seen.insert(q.exchange);
    }

    REQUIRE(seen == venues);
}

TEST_CASE("QuoteGenerator: Symbol dashes become slashes", "[quote]") {
    QuoteGenerator gen;
    REQUIRE(gen.generate("BTC-USD").symbol == "BTC/USD");
    REQUIRE(gen.generate("A-B-C").symbol == "A/B/C");
    REQUIRE(gen.generate("AAPL").symbol == "AAPL");
}

TEST_CASE("QuoteGenerator: Timestamp is ISO-8601 UTC with Z", "[quote]") {
    QuoteGenerator gen;
    MarketQuote q = gen.generate("BTC-USD");

    std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z)");
    REQUIRE(std::regex_match(q.timestamp, iso));
    REQUIRE(q.timestamp.find("+00:00") == std::string::npos);
}

TEST_CASE("QuoteGenerator: Consecutive quotes differ but echo the same symbol", "[quote]") {
    QuoteGenerator gen;
    MarketQuote a = gen.generate("ETH-USD");

    bool differs = false;
    for (int i = 0; i < 10 && !differs; ++i) {
        MarketQuote b = gen.generate("ETH-USD");
        REQUIRE(b.symbol == a.symbol);
        differs = b.price != a.price || b.bid != a.bid || b.ask != a.ask;
    }
    REQUIRE(differs);
}

// ============================================================
// Envelope
// ============================================================

TEST_CASE("QuoteGenerator: Envelope wraps fields under data", "[quote]") {
    QuoteGenerator gen;
    std::string body = gen.generateEnvelope("ETH-USD");

    auto j = nlohmann::json::parse(body);
    REQUIRE(j.size() == 1);
    REQUIRE(j.contains("data"));

    const auto& d = j["data"];
    REQUIRE(d["symbol"] == "ETH/USD");
    for (const char* key : { "price", "bid", "ask", "volume", "timestamp", "exchange" }) {
        REQUIRE(d.contains(key));
    }
    REQUIRE(d.size() == 7);
}

TEST_CASE("QuoteGenerator: Envelope is pretty-printed with two spaces", "[quote]") {
    QuoteGenerator gen;
    std::string body = gen.generateEnvelope("AAPL");

    REQUIRE(body.rfind("{\n  \"data\": {\n    \"symbol\": \"AAPL\"", 0) == 0);
}

// ============================================================
// Custom parameters
// ============================================================

TEST_CASE("QuoteGenerator: Profiles are checked in order", "[quote]") {
    ServerConfig::MarketDataParams params;
    params.profiles = {
        { "BT", 10.0, 0.0 },
        { "BTC", 50000.0, 0.0 }
    };

    QuoteGenerator gen(params);
    REQUIRE(gen.generate("BTC-USD").price == Approx(10.0));
}

TEST_CASE("QuoteGenerator: Zero jitter gives exact prices", "[quote]") {
    ServerConfig::MarketDataParams params;
    params.profiles = { { "FIX", 1000.0, 0.0 } };

    QuoteGenerator gen(params);
    MarketQuote q = gen.generate("FIX");

    REQUIRE(q.price == Approx(1000.0));
    REQUIRE(q.bid == Approx(999.5));
    REQUIRE(q.ask == Approx(1000.5));
}

TEST_CASE("QuoteGenerator: Rejects parameters it cannot draw from", "[quote]") {
    ServerConfig::MarketDataParams noVenues;
    noVenues.exchanges.clear();
    REQUIRE_THROWS_AS(QuoteGenerator(noVenues), std::invalid_argument);

    ServerConfig::MarketDataParams negativeJitter;
    negativeJitter.profiles = { { "BTC", 35000.0, -500.0 } };
    REQUIRE_THROWS_AS(QuoteGenerator(negativeJitter), std::invalid_argument);

    ServerConfig::MarketDataParams negativeVolume;
    negativeVolume.volumeRange = -1.0;
    REQUIRE_THROWS_AS(QuoteGenerator(negativeVolume), std::invalid_argument);
}

TEST_CASE("QuoteGenerator: round2", "[quote]") {
    REQUIRE(QuoteGenerator::round2(1.234) == Approx(1.23));
    REQUIRE(QuoteGenerator::round2(1.236) == Approx(1.24));
    REQUIRE(QuoteGenerator::round2(35000.0) == Approx(35000.0));
}
