#include "exec/active_trades.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>
#include "state/json_file.hpp"

using json = nlohmann::json;

namespace exec {

bool ActiveTrades::load(){
    if (path_.empty()) return true;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return true;
    auto j = state::read_json_file(path_);
    if (!j || !j->is_array()) {
        spdlog::error("Active trades file {} unreadable, starting empty", path_);
        return false;
    }
    std::vector<TradeSignal> loaded;
    for (const auto& e : *j) {
        try {
            loaded.push_back(e.get<TradeSignal>());
        } catch (const std::exception& ex) {
            spdlog::warn("Skipping active trade record: {}", ex.what());
        }
    }
    std::lock_guard<std::mutex> lk(mtx_);
    trades_ = std::move(loaded);
    spdlog::info("Restored {} active trades from {}", trades_.size(), path_);
    return true;
}

bool ActiveTrades::save() const {
    if (path_.empty()) return true;
    json arr = json::array();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& t : trades_) arr.push_back(json(t));
    }
    return state::write_json_file(path_, arr);
}

void ActiveTrades::add(const TradeSignal& s){
    std::lock_guard<std::mutex> lk(mtx_);
    trades_.push_back(s);
}

std::size_t ActiveTrades::remove(const Pair& pair){
    std::lock_guard<std::mutex> lk(mtx_);
    const auto before = trades_.size();
    trades_.erase(std::remove_if(trades_.begin(), trades_.end(),
                                 [&](const TradeSignal& t){ return t.pair == pair; }),
                  trades_.end());
    return before - trades_.size();
}

std::vector<TradeSignal> ActiveTrades::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return trades_;
}

std::set<std::string> ActiveTrades::currencies() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::set<std::string> out;
    for (const auto& t : trades_) { out.insert(t.pair.base); out.insert(t.pair.quote); }
    return out;
}

bool ActiveTrades::has_open(const Pair& pair) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::any_of(trades_.begin(), trades_.end(), [&](const TradeSignal& t){ return t.pair == pair; });
}

std::size_t ActiveTrades::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return trades_.size();
}

} // namespace exec
