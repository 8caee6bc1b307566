#include "data/oanda_rest.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include "core/session.hpp"

using json = nlohmann::json;

namespace data {

static double to_d(const json& j, const char* k){
    if (!j.contains(k)) return 0.0;
    if (j[k].is_string()) return std::strtod(j[k].get_ref<const std::string&>().c_str(), nullptr);
    if (j[k].is_number()) return j[k].get<double>();
    return 0.0;
}

std::optional<std::int64_t> parse_rfc3339(const std::string& s){
    int y=0, mo=0, d=0, h=0, mi=0, sec=0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d", &y, &mo, &d, &h, &mi, &sec) != 6) {
        // OANDA may also send UNIX seconds as "1714568400.000000000"
        char* end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (end == s.c_str()) return std::nullopt;
        return static_cast<std::int64_t>(v);
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31) return std::nullopt;
    return core::days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d)) * 86400
         + h * 3600 + mi * 60 + sec;
}

Candles parse_candles(const json& j){
    Candles out;
    if (!j.contains("candles") || !j["candles"].is_array()) return out;
    for (const auto& c : j["candles"]) {
        if (!c.contains("mid") || !c["mid"].is_object()) continue;
        const auto& mid = c["mid"];
        Candle b;
        if (auto t = parse_rfc3339(c.value("time", std::string{}))) b.time = *t;
        b.open  = to_d(mid, "o");
        b.high  = to_d(mid, "h");
        b.low   = to_d(mid, "l");
        b.close = to_d(mid, "c");
        b.complete = c.value("complete", true);
        out.push_back(b);
    }
    return out;
}

OandaRest::OandaRest(OandaConfig cfg, RetryPolicy retry)
    : cfg_(std::move(cfg)), retry_(std::move(retry)) {}

std::optional<json> OandaRest::http_get(const std::string& path, const std::string& query){
    const std::string url = cfg_.api + path + (query.empty() ? "" : "?" + query);
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Header{{"Authorization", "Bearer " + cfg_.token}},
                               cpr::Timeout{cfg_.timeout_ms},
                               cpr::VerifySsl{true});
    if (r.error) {
        spdlog::warn("GET {} : transport error: {}", path, r.error.message);
        return std::nullopt;
    }
    if (r.status_code == 429 || r.status_code >= 500) {
        spdlog::warn("GET {} : {} {}", path, r.status_code, r.text);
        return std::nullopt;
    }
    if (r.status_code >= 400) {
        // not retryable (bad instrument, auth)
        spdlog::error("GET {} : {} {}", path, r.status_code, r.text);
        return json::object();
    }
    try {
        return json::parse(r.text.empty() ? "{}" : r.text);
    } catch (const json::exception& e) {
        spdlog::warn("GET {} : bad JSON: {}", path, e.what());
        return std::nullopt;
    }
}

Candles OandaRest::get(const Pair& pair, Timeframe tf, std::size_t count){
    const std::string path = "/instruments/" + pair.name() + "/candles";
    const std::string query = "granularity=" + std::string(to_string(tf))
                            + "&count=" + std::to_string(count) + "&price=M";
    auto j = retry_.run([&]{ return http_get(path, query); },
                        "candles " + pair.name() + " " + to_string(tf));
    if (!j) return {};
    try {
        return parse_candles(*j);
    } catch (const json::exception& e) {
        spdlog::warn("candles {} : unexpected payload: {}", pair.name(), e.what());
        return {};
    }
}

} // namespace data
