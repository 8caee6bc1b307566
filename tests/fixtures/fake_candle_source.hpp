#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include "data/candle_source.hpp"

/// In-memory candle source keyed by pair and timeframe
class FakeCandleSource : public data::ICandleSource {
public:
    Candles get(const Pair& pair, Timeframe tf, std::size_t count) override {
        ++calls_;
        if (throws_) throw std::runtime_error("feed down");
        auto it = series_.find(key(pair, tf));
        const Candles& all = it != series_.end() ? it->second : fallback_;
        if (all.size() <= count) return all;
        return Candles(all.end() - static_cast<std::ptrdiff_t>(count), all.end());
    }

    void set(const std::string& pair, Timeframe tf, Candles c) {
        series_[pair + "/" + to_string(tf)] = std::move(c);
    }

    // Returned for every series not set explicitly
    void set_fallback(Candles c) { fallback_ = std::move(c); }
    void set_throws(bool t) { throws_ = t; }
    int calls() const { return calls_; }

private:
    static std::string key(const Pair& p, Timeframe tf) { return p.name() + "/" + to_string(tf); }

    std::map<std::string, Candles> series_;
    Candles fallback_;
    bool throws_{false};
    int calls_{0};
};
