#include "FixtureProvisioner.hpp"
#include "core/Clock.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace mockapi {

    FixtureProvisioner::FixtureProvisioner(const fs::path& root,
                                           const ServerConfig::FixtureParams& params)
        : root_(root)
        , params_(params)
    {
    }

    void FixtureProvisioner::run() {
        ensureLayout();

        if (ensureRootDescriptor()) {
            Logger::info("Created root descriptor {}", (root_ / params_.rootDescriptor).string());
        }

        if (params_.seedSamples) {
            size_t written = seedSamples();
            Logger::info("Seeded {} sample fixture(s) under {}", written, root_.string());
        }
    }

    void FixtureProvisioner::ensureLayout() {
        for (const auto& dir : params_.directories) {
            std::error_code ec;
            fs::create_directories(root_ / dir, ec);
            if (ec) {
                throw std::runtime_error("Failed to create directory " + (root_ / dir).string() + ": " + ec.message());
            }
        }
        Logger::debug("Fixture layout ready ({} directories)", params_.directories.size());
    }

    bool FixtureProvisioner::ensureRootDescriptor() {
        return writeIfMissing(params_.rootDescriptor, defaultRootDescriptor());
    }

    nlohmann::ordered_json FixtureProvisioner::defaultRootDescriptor() {
        nlohmann::ordered_json j;
        j["name"] = "ARB Platform API";
        j["version"] = "0.1.0";
        j["status"] = "simulation";
        j["message"] = "This is a simulation. For full functionality, install Rust.";
        j["documentation"] = "/api-docs";
        return j;
    }

    bool FixtureProvisioner::writeIfMissing(const std::string& relPath, const nlohmann::ordered_json& content) {
        fs::path target = root_ / relPath;

        std::error_code ec;
        if (fs::exists(target, ec)) {
            return false;
        }

        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                throw std::runtime_error("Failed to create directory " + target.parent_path().string() + ": " + ec.message());
            }
        }

        std::ofstream file(target, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to write fixture " + target.string());
        }
        file << content.dump(2) << "\n";
        if (!file) {
            throw std::runtime_error("Failed to write fixture " + target.string());
        }

        Logger::debug("Wrote fixture {}", target.string());
        return true;
    }

    size_t FixtureProvisioner::seedSamples() {
        const std::string now = Clock::nowIsoSeconds();
        const std::string& index = params_.indexFile;
        size_t written = 0;

        {
            nlohmann::ordered_json j;
            j["endpoints"] = {
                "/api/health",
                "/api/market/symbols",
                "/api/market/data/{symbol}",
                "/api/strategy",
                "/api/strategy/{name}/params",
                "/api/account/balance"
            };
            j["message"] = "This is a simulation mode. Install Rust for full functionality.";
            written += writeIfMissing("api/" + index, j);
        }

        {
            nlohmann::ordered_json services;
            services["database"] = "healthy";
            services["market_data"] = "healthy";
            services["order_system"] = "healthy";
            services["strategy_engine"] = "healthy";

            nlohmann::ordered_json j;
            j["status"] = "ok";
            j["timestamp"] = now;
            j["version"] = "0.1.0";
            j["services"] = services;
            j["uptime"] = "00:00:01";
            j["mode"] = "simulation";
            written += writeIfMissing("api/health/" + index, j);
        }

        {
            nlohmann::ordered_json j;
            j["data"] = {
                "BTC/USD", "ETH/USD", "SOL/USD", "AAPL", "MSFT",
                "TSLA", "AMZN", "GOOGL", "EUR/USD", "JPY/USD"
            };
            written += writeIfMissing("api/market/symbols/" + index, j);
        }

        {
            nlohmann::ordered_json data;
            data["symbol"] = "BTC/USD";
            data["price"] = 35245.67;
            data["bid"] = 35240.23;
            data["ask"] = 35250.12;
            data["volume"] = 15234.51;
            data["timestamp"] = now;
            data["exchange"] = "Binance";

            nlohmann::ordered_json j;
            j["data"] = data;
            written += writeIfMissing("api/market/data/BTC-USD/" + index, j);
        }

        {
            nlohmann::ordered_json j;
            j["data"] = {
                "Statistical Arbitrage",
                "Event Arbitrage",
                "Information Arbitrage",
                "Latency Arbitrage",
                "Day Trading"
            };
            written += writeIfMissing("api/strategy/" + index, j);
        }

        {
            nlohmann::ordered_json data;
            data["correlation_threshold"] = 0.8;
            data["z_score_threshold"] = 2.0;
            data["lookback_period"] = 100;
            data["max_position_size"] = 100000.0;

            nlohmann::ordered_json j;
            j["data"] = data;
            written += writeIfMissing("api/strategy/Statistical-Arbitrage/params/" + index, j);
        }

        {
            nlohmann::ordered_json balances = nlohmann::ordered_json::array();
            balances.push_back({ {"currency", "BTC"}, {"amount", 2.5} });
            balances.push_back({ {"currency", "ETH"}, {"amount", 30.0} });
            balances.push_back({ {"currency", "SOL"}, {"amount", 150.0} });

            nlohmann::ordered_json data;
            data["total"] = 1000000.0;
            data["available"] = 750000.0;
            data["currency"] = "USD";
            data["additional_balances"] = balances;
            data["timestamp"] = now;

            nlohmann::ordered_json j;
            j["data"] = data;
            written += writeIfMissing("api/account/balance/" + index, j);
        }

        return written;
    }

} // namespace mockapi
