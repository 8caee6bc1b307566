#include "data/csv_candle_source.hpp"
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace data {

bool load_csv(const std::string& path, Candles& out) {
    std::ifstream f(path);
    if (!f.good()) return false;
    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        std::stringstream ss(line);
        std::string x; Candle r{};
        try {
            if (!std::getline(ss,x,',')) continue; r.time  = std::stoll(x);
            if (!std::getline(ss,x,',')) continue; r.open  = std::stod(x);
            if (!std::getline(ss,x,',')) continue; r.high  = std::stod(x);
            if (!std::getline(ss,x,',')) continue; r.low   = std::stod(x);
            if (!std::getline(ss,x,',')) continue; r.close = std::stod(x);
        } catch (const std::logic_error&) {
            // header or malformed row
            continue;
        }
        out.push_back(r);
    }
    return !out.empty();
}

Candles CsvCandleSource::get(const Pair& pair, Timeframe tf, std::size_t count) {
    const std::string key = pair.name() + "_" + to_string(tf);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        Candles rows;
        if (!load_csv(dir_ + "/" + key + ".csv", rows))
            spdlog::debug("No CSV data for {}", key);
        it = cache_.emplace(key, std::move(rows)).first;
    }
    const auto& all = it->second;
    if (all.size() <= count) return all;
    return Candles(all.end() - static_cast<std::ptrdiff_t>(count), all.end());
}

} // namespace data
