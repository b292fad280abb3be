#include "QuoteGenerator.hpp"
#include "core/Clock.hpp"
#include "utils/Random.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace mockapi {

    QuoteGenerator::QuoteGenerator()
        : params_() {}

    QuoteGenerator::QuoteGenerator(ServerConfig::MarketDataParams params)
        : params_(std::move(params)) {
        params_.validate();
    }

    double QuoteGenerator::round2(double value) {
        return std::round(value * 100.0) / 100.0;
    }

    std::string QuoteGenerator::displaySymbol(const std::string& symbol) {
        std::string out = symbol;
        std::replace(out.begin(), out.end(), '-', '/');
        return out;
    }

    double QuoteGenerator::basePriceFor(const std::string& symbol) const {
        for (const auto& profile : params_.profiles) {
            if (symbol.compare(0, profile.prefix.size(), profile.prefix) == 0) {
                return profile.base + Random::uniform(-profile.jitter, profile.jitter);
            }
        }
        return params_.defaultBase + Random::uniform(-params_.defaultJitter, params_.defaultJitter);
    }

    MarketQuote QuoteGenerator::generate(const std::string& symbol) const {
        double base = basePriceFor(symbol);
        double spread = base * params_.spreadRatio;

        MarketQuote quote;
        quote.symbol = displaySymbol(symbol);
        quote.price = round2(base);
        quote.bid = round2(base - spread / 2.0);
        quote.ask = round2(base + spread / 2.0);
        quote.volume = round2(params_.volumeBase + Random::uniform(0.0, params_.volumeRange));
        quote.timestamp = Clock::nowIsoMicros();
        quote.exchange = Random::choice(params_.exchanges);
        return quote;
    }

    nlohmann::ordered_json QuoteGenerator::toJson(const MarketQuote& quote) {
        // Insertion order is the field order clients see
        nlohmann::ordered_json data;
        data["symbol"] = quote.symbol;
        data["price"] = quote.price;
        data["bid"] = quote.bid;
        data["ask"] = quote.ask;
        data["volume"] = quote.volume;
        data["timestamp"] = quote.timestamp;
        data["exchange"] = quote.exchange;
        return data;
    }

    std::string QuoteGenerator::generateEnvelope(const std::string& symbol) const {
        nlohmann::ordered_json envelope;
        envelope["data"] = toJson(generate(symbol));
        return envelope.dump(2);
    }

} // namespace mockapi
