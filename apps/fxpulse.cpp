#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "data/csv_candle_source.hpp"
#include "data/oanda_rest.hpp"
#include "engine/evaluator.hpp"
#include "telemetry/notifier.hpp"
#include "telemetry/telegram_notifier.hpp"

static std::atomic<bool> g_running{true};

static void usage(){
    spdlog::info("Usage: fxpulse [config.json] [--once] [--debug] [--csv-dir <dir>] [--dry-run]");
}

int main(int argc, char** argv) {
    std::string cfg_path;
    std::string csv_dir;
    bool once = false, debug = false, dry_run = false;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--once") == 0) once = true;
        else if (std::strcmp(a, "--debug") == 0) debug = true;
        else if (std::strcmp(a, "--dry-run") == 0) dry_run = true;
        else if (std::strcmp(a, "--csv-dir") == 0 && i + 1 < argc) csv_dir = argv[++i];
        else if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) { usage(); return 0; }
        else if (a[0] == '-') { spdlog::error("Unknown option: {}", a); usage(); return 1; }
        else cfg_path = a;
    }

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    core::AppConfig cfg;
    try {
        cfg = core::load_config(cfg_path);
    } catch (const std::exception& e) {
        spdlog::critical("Config error: {}", e.what());
        return 2;
    }
    if (!csv_dir.empty()) cfg.csv_dir = csv_dir;
    if (dry_run) cfg.dry_run = true;

    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::from_str(cfg.log_level));

    // --- candle source
    std::unique_ptr<data::ICandleSource> source;
    if (!cfg.csv_dir.empty()) {
        spdlog::info("Replaying candles from {}", cfg.csv_dir);
        source = std::make_unique<data::CsvCandleSource>(cfg.csv_dir);
    } else {
        if (cfg.oanda.token.empty()) {
            spdlog::critical("OANDA token missing (config oanda.token or OANDA_TOKEN)");
            return 2;
        }
        data::RetryPolicy retry;
        retry.max_attempts = cfg.retry_attempts;
        retry.base_delay = std::chrono::milliseconds(cfg.retry_base_ms);
        source = std::make_unique<data::OandaRest>(cfg.oanda, retry);
    }

    // --- notifier
    std::unique_ptr<telemetry::INotifier> notifier;
    if (cfg.dry_run || !cfg.telegram.valid()) {
        if (!cfg.dry_run) spdlog::warn("Telegram credentials missing, notifications go to the log");
        notifier = std::make_unique<telemetry::LogNotifier>();
    } else {
        notifier = std::make_unique<telemetry::TelegramNotifier>(cfg.telegram);
    }

    engine::Evaluator ev(cfg, *source, *notifier);
    ev.restore();

    std::signal(SIGINT,  [](int){ g_running.store(false); });
    std::signal(SIGTERM, [](int){ g_running.store(false); });

    spdlog::info("fxpulse started: {} pairs, interval {} s", ev.pairs().size(), cfg.loop_interval_sec);

    while (g_running.load()) {
        const auto t0 = std::chrono::steady_clock::now();
        const auto r = ev.tick();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - t0).count();
        spdlog::info("Tick done in {} ms: {} ranked, {} signals, {} group breakouts",
                     ms, r.ranks.size(), r.signals.size(), r.group_breakouts.size());
        if (once) break;

        const auto deadline = t0 + std::chrono::seconds(cfg.loop_interval_sec);
        while (g_running.load() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    ev.flush();
    spdlog::info("fxpulse stopped");
    return 0;
}
