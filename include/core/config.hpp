#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "data/oanda_rest.hpp"
#include "strategy/breakout.hpp"
#include "strategy/signal_builder.hpp"
#include "strategy/strength.hpp"
#include "telemetry/telegram_notifier.hpp"

namespace core {

struct CooldownConfig {
    std::int64_t strength_alert_sec{4 * 3600};
    std::int64_t group_breakout_sec{3600};
    std::int64_t heartbeat_sec{24 * 3600};
    std::int64_t news_sec{24 * 3600};
};

struct GroupBreakoutConfig {
    bool enabled{true};
    std::size_t min_pairs{4};
    Timeframe tf{Timeframe::H1};
    std::size_t bars{100};
    std::string strategy_id{"range"};
    // swing high/low of the window, 0.5 ATR impulse, EMA50 side, RSI beyond 55/45
    strategy::BreakoutSettings settings{12, {99, true, 0, 0.5, 14, 50, 5.0, 14}};
};

struct StateConfig {
    std::string cooldown_file{"bot_state.json"};
    std::string active_trades_file{"active_trades.json"};
};

struct AppConfig {
    std::vector<std::string> pairs{
        "EUR_USD", "GBP_USD", "USD_JPY", "USD_CHF", "AUD_USD", "NZD_USD", "USD_CAD",
        "EUR_GBP", "EUR_JPY", "GBP_JPY", "EUR_AUD", "EUR_CAD", "EUR_NZD",
        "GBP_AUD", "GBP_CAD", "GBP_NZD",
        "AUD_JPY", "NZD_JPY", "CAD_JPY", "CHF_JPY",
        "AUD_NZD", "AUD_CAD", "AUD_CHF",
        "NZD_CAD", "NZD_CHF",
        "CAD_CHF",
        "EUR_CHF", "GBP_CHF"};

    data::OandaConfig oanda{};
    int retry_attempts{3};
    int retry_base_ms{500};

    telemetry::TelegramConfig telegram{};
    bool dry_run{false};               // log notifications instead of sending

    strategy::StrengthConfig strength{};
    strategy::SignalConfig signal{};
    std::size_t max_signals_per_tick{1};
    GroupBreakoutConfig group{};
    CooldownConfig cooldowns{};
    StateConfig state{};

    bool heartbeat{true};
    int loop_interval_sec{300};
    std::string log_level{"info"};
    std::string csv_dir;               // non-empty: replay from CSV instead of OANDA
};

// Reads the JSON file (missing keys keep their defaults), then applies
// OANDA_TOKEN, OANDA_ACCOUNT, OANDA_API, TELEGRAM_TOKEN, TELEGRAM_CHAT_ID, PAIRS.
// Throws std::runtime_error when the file is unreadable or invalid.
AppConfig load_config(const std::string& path);

// Same from an already parsed document (no environment overrides)
AppConfig config_from_json(const nlohmann::json& j);

void apply_env_overrides(AppConfig& cfg);

} // namespace core
