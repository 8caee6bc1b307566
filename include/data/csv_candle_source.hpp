#pragma once
#include <map>
#include <string>
#include "data/candle_source.hpp"

namespace data {

// time,open,high,low,close rows (optional header line)
bool load_csv(const std::string& path, Candles& out);

// Offline replay: reads <dir>/<PAIR>_<TF>.csv, e.g. EUR_USD_H1.csv.
// Files are loaded lazily and cached.
class CsvCandleSource final : public ICandleSource {
public:
    explicit CsvCandleSource(std::string dir) : dir_(std::move(dir)) {}

    Candles get(const Pair& pair, Timeframe tf, std::size_t count) override;

private:
    std::string dir_;
    std::map<std::string, Candles> cache_;
};

} // namespace data
