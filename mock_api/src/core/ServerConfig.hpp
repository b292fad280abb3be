#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <type_traits>
#include <stdexcept>
#include <utility>

namespace mockapi {

    /// Every tunable knob of the mock server.  Defaults reproduce the
    /// behaviour front-end developers expect out of the box (port 8000,
    /// fixtures under the working directory, the stock price bands).
    /// A JSON config file is merge-patched on top, then command-line
    /// options on top of that.

    struct ServerConfig {

        // ---- HTTP listener -------------------------------------------------------
        struct ServerParams {
            std::string host = "0.0.0.0";
            int    port = 8000;
            int    threadPoolSize = 8;
            int    readTimeoutSec = 5;
            int    writeTimeoutSec = 5;
        } server;

        // ---- Fixture tree --------------------------------------------------------
        struct FixtureParams {
            std::string rootDir = ".";
            std::string rootDescriptor = "index.json";
            std::string indexFile = "index.json";
            bool   provision = true;
            bool   seedSamples = false;
            std::vector<std::string> directories = {
                "api/health",
                "api/market/symbols",
                "api/market/data",
                "api/strategy",
                "api/account/balance"
            };
        } fixtures;

        // ---- Synthetic quotes ----------------------------------------------------
        struct PriceProfile {
            std::string prefix;
            double base = 0.0;
            double jitter = 0.0;    // uniform in [-jitter, +jitter]
        };

        struct MarketDataParams {
            double spreadRatio = 0.001;   // 0.1 % of base price
            double volumeBase = 1000.0;
            double volumeRange = 5000.0;
            double defaultBase = 100.0;
            double defaultJitter = 10.0;
            std::vector<std::string> exchanges = { "Binance", "Coinbase", "Kraken", "FTX" };
            // Checked in order, first prefix match wins
            std::vector<PriceProfile> profiles = {
                { "BTC",  35000.0, 500.0 },
                { "ETH",  2200.0,  50.0 },
                { "SOL",  80.0,    5.0 },
                { "AAPL", 175.0,   2.0 }
            };

            // Throws std::invalid_argument for values the quote generator
            // cannot draw from
            void validate() const {
                if (exchanges.empty()) {
                    throw std::invalid_argument("marketData.exchanges must not be empty");
                }
                if (volumeRange < 0.0) {
                    throw std::invalid_argument("marketData.volumeRange must not be negative");
                }
                if (defaultJitter < 0.0) {
                    throw std::invalid_argument("marketData.defaultJitter must not be negative");
                }
                if (spreadRatio < 0.0) {
                    throw std::invalid_argument("marketData.spreadRatio must not be negative");
                }
                for (const auto& p : profiles) {
                    if (p.prefix.empty()) {
                        throw std::invalid_argument("marketData.profiles: prefix must not be empty");
                    }
                    if (p.jitter < 0.0) {
                        throw std::invalid_argument("marketData.profiles[" + p.prefix + "]: jitter must not be negative");
                    }
                }
            }
        } marketData;

        // ---- Logging -------------------------------------------------------------
        struct LoggingParams {
            std::string file = "mock_api.log";
            std::string level = "info";
            bool   console = true;
        } logging;

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["server"] = {
                {"host",            server.host},
                {"port",            server.port},
                {"threadPoolSize",  server.threadPoolSize},
                {"readTimeoutSec",  server.readTimeoutSec},
                {"writeTimeoutSec", server.writeTimeoutSec}
            };

            j["fixtures"] = {
                {"rootDir",        fixtures.rootDir},
                {"rootDescriptor", fixtures.rootDescriptor},
                {"indexFile",      fixtures.indexFile},
                {"provision",      fixtures.provision},
                {"seedSamples",    fixtures.seedSamples},
                {"directories",    fixtures.directories}
            };

            nlohmann::json profiles = nlohmann::json::array();
            for (const auto& p : marketData.profiles) {
                profiles.push_back({ {"prefix", p.prefix}, {"base", p.base}, {"jitter", p.jitter} });
            }

            j["marketData"] = {
                {"spreadRatio",   marketData.spreadRatio},
                {"volumeBase",    marketData.volumeBase},
                {"volumeRange",   marketData.volumeRange},
                {"defaultBase",   marketData.defaultBase},
                {"defaultJitter", marketData.defaultJitter},
                {"exchanges",     marketData.exchanges},
                {"profiles",      profiles}
            };

            j["logging"] = {
                {"file",    logging.file},
                {"level",   logging.level},
                {"console", logging.console}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.  Arrays replace wholesale.
        /// All or nothing: on a type error or an invalid value this throws
        /// and leaves the config unchanged.
        void fromJson(const nlohmann::json& j) {
            ServerConfig patched = *this;
            patched.mergePatch(j);
            patched.validate();
            *this = std::move(patched);
        }

        void validate() const {
            marketData.validate();
        }

    private:
        void mergePatch(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (j.contains("server")) {
                auto& s = j["server"];
                get(s, "host", server.host);
                get(s, "port", server.port);
                get(s, "threadPoolSize", server.threadPoolSize);
                get(s, "readTimeoutSec", server.readTimeoutSec);
                get(s, "writeTimeoutSec", server.writeTimeoutSec);
            }

            if (j.contains("fixtures")) {
                auto& f = j["fixtures"];
                get(f, "rootDir", fixtures.rootDir);
                get(f, "rootDescriptor", fixtures.rootDescriptor);
                get(f, "indexFile", fixtures.indexFile);
                get(f, "provision", fixtures.provision);
                get(f, "seedSamples", fixtures.seedSamples);
                get(f, "directories", fixtures.directories);
            }

            if (j.contains("marketData")) {
                auto& m = j["marketData"];
                get(m, "spreadRatio", marketData.spreadRatio);
                get(m, "volumeBase", marketData.volumeBase);
                get(m, "volumeRange", marketData.volumeRange);
                get(m, "defaultBase", marketData.defaultBase);
                get(m, "defaultJitter", marketData.defaultJitter);
                get(m, "exchanges", marketData.exchanges);

                if (m.contains("profiles")) {
                    marketData.profiles.clear();
                    for (const auto& p : m["profiles"]) {
                        marketData.profiles.push_back({
                            p.value("prefix", std::string()),
                            p.at("base").get<double>(),
                            p.value("jitter", 0.0)
                            });
                    }
                }
            }

            if (j.contains("logging")) {
                auto& l = j["logging"];
                get(l, "file", logging.file);
                get(l, "level", logging.level);
                get(l, "console", logging.console);
            }
        }
    };

} // namespace mockapi
