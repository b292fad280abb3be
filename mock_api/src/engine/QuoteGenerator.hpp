#pragma once

#include "core/Types.hpp"
#include "core/ServerConfig.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace mockapi {

    // Produces plausible-looking quotes for any ticker. Stateless apart
    // from its parameters; safe to share between handler threads.
    class QuoteGenerator {
    public:
        QuoteGenerator();
        // Throws std::invalid_argument for unusable parameters
        explicit QuoteGenerator(ServerConfig::MarketDataParams params);

        // Fresh quote for `symbol`, e.g. "BTC-USD" -> symbol "BTC/USD"
        MarketQuote generate(const std::string& symbol) const;

        // Jittered base price from the first matching prefix profile
        double basePriceFor(const std::string& symbol) const;

        // {"data": {...}} pretty-printed with a 2-space indent
        std::string generateEnvelope(const std::string& symbol) const;

        static nlohmann::ordered_json toJson(const MarketQuote& quote);

        // "BTC-USD" -> "BTC/USD"
        static std::string displaySymbol(const std::string& symbol);

        static double round2(double value);

        const ServerConfig::MarketDataParams& getParams() const { return params_; }

    private:
        ServerConfig::MarketDataParams params_;
    };

} // namespace mockapi
