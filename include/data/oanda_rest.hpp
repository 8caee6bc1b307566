#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "data/candle_source.hpp"

namespace data {

// --- Connection config
struct OandaConfig {
    std::string token;
    std::string account;
    std::string api{"https://api-fxtrade.oanda.com/v3"};
    int timeout_ms{10000};
};

// "2024-05-01T13:00:00.000000000Z" -> UNIX seconds
std::optional<std::int64_t> parse_rfc3339(const std::string& s);

// candles JSON ({"candles":[{"time":..,"complete":..,"mid":{"o","h","l","c"}}]})
Candles parse_candles(const nlohmann::json& j);

// OANDA v20 REST candle source (mid prices)
class OandaRest final : public ICandleSource {
public:
    OandaRest(OandaConfig cfg, RetryPolicy retry = {});

    // GET /instruments/{pair}/candles
    Candles get(const Pair& pair, Timeframe tf, std::size_t count) override;

private:
    // nullopt: transient failure (transport, 429, 5xx)
    std::optional<nlohmann::json> http_get(const std::string& path, const std::string& query);

    OandaConfig cfg_;
    RetryPolicy retry_;
};

} // namespace data
