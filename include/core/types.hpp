#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <algorithm>

// Timeframe (OANDA granularity names)
enum class Timeframe { M1, M5, M15, M30, H1, H4, D1 };

inline const char* to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return "M1";
        case Timeframe::M5:  return "M5";
        case Timeframe::M15: return "M15";
        case Timeframe::M30: return "M30";
        case Timeframe::H1:  return "H1";
        case Timeframe::H4:  return "H4";
        default:             return "D";
    }
}

std::optional<Timeframe> parse_timeframe(const std::string& s);

// Tracked currencies (closed set)
inline constexpr std::array<const char*, 8> kCurrencies{
    "EUR", "GBP", "USD", "JPY", "CHF", "AUD", "NZD", "CAD"};

bool is_tracked_currency(const std::string& c);

// Currency pair, canonical text form "BASE_QUOTE"
struct Pair {
    std::string base{"EUR"};
    std::string quote{"USD"};
    std::string name() const { return base + "_" + quote; }
    Pair inverse() const { return {quote, base}; }
    bool contains(const std::string& c) const { return base == c || quote == c; }
    bool operator==(const Pair& o) const { return base == o.base && quote == o.quote; }
    bool operator!=(const Pair& o) const { return !(*this == o); }
};

// nullopt for malformed ids ("EURUSD", "EUR_") or untracked currencies
std::optional<Pair> parse_pair(const std::string& id);

// Parses an allow-list; bad entries and inverses of already listed pairs are
// dropped with a warning.
std::vector<Pair> parse_pairs(const std::vector<std::string>& ids);

// OHLC candle, time = period open (UNIX seconds)
struct Candle {
    std::int64_t time{};
    double open{};
    double high{};
    double low{};
    double close{};
    bool complete{true};
};

using Candles = std::vector<Candle>;

inline std::vector<double> closes_of(const Candles& c) {
    std::vector<double> out; out.reserve(c.size());
    for (const auto& b : c) out.push_back(b.close);
    return out;
}

// Trade direction
enum class Direction { Buy, Sell };

inline const char* to_string(Direction d) {
    return d == Direction::Buy ? "BUY" : "SELL";
}

inline Direction opposite(Direction d) {
    return d == Direction::Buy ? Direction::Sell : Direction::Buy;
}

// Currency -> rank in [-7,+7], 0 excluded
using RankMap = std::map<std::string, int>;
