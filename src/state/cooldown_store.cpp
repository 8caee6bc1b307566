#include "state/cooldown_store.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>
#include "state/json_file.hpp"

using json = nlohmann::json;

namespace state {

std::optional<CooldownKey> CooldownKey::parse(const std::string& s){
    const auto pos = s.find('|');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= s.size()) return std::nullopt;
    return CooldownKey{s.substr(0, pos), s.substr(pos + 1)};
}

CooldownStore::CooldownStore(std::string path, bool autoflush)
    : path_(std::move(path)), autoflush_(autoflush) {}

CooldownStore::~CooldownStore(){
    std::lock_guard<std::mutex> lk(mtx_);
    if (!path_.empty()) flush_locked();
}

bool CooldownStore::load(){
    std::lock_guard<std::mutex> lk(mtx_);
    if (path_.empty()) return true;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("No cooldown state at {}, starting empty", path_);
        last_.clear();
        return true;
    }
    auto j = read_json_file(path_);
    if (!j || !j->is_object()) {
        spdlog::error("Cooldown state {} unreadable, continuing with in-memory state", path_);
        return false;
    }

    std::map<CooldownKey, std::int64_t> loaded;
    const auto& entries = j->contains("cooldowns") ? (*j)["cooldowns"] : *j;
    if (!entries.is_object()) {
        spdlog::error("Cooldown state {} has no 'cooldowns' object", path_);
        return false;
    }
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        auto key = CooldownKey::parse(it.key());
        if (!key || !it.value().is_number()) {
            spdlog::warn("Ignoring cooldown entry '{}'", it.key());
            continue;
        }
        loaded[*key] = it.value().get<std::int64_t>();
    }
    last_ = std::move(loaded);
    spdlog::info("Restored {} cooldown keys from {}", last_.size(), path_);
    return true;
}

bool CooldownStore::flush(){
    std::lock_guard<std::mutex> lk(mtx_);
    return flush_locked();
}

bool CooldownStore::flush_locked(){
    if (path_.empty()) return true;
    json entries = json::object();
    for (const auto& [k, ts] : last_) entries[k.str()] = ts;
    return write_json_file(path_, json{{"cooldowns", entries}});
}

bool CooldownStore::is_allowed(const CooldownKey& key, std::int64_t now, std::int64_t window_sec) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = last_.find(key);
    return it == last_.end() || now - it->second >= window_sec;
}

void CooldownStore::record(const CooldownKey& key, std::int64_t now){
    std::lock_guard<std::mutex> lk(mtx_);
    last_[key] = now;
    if (autoflush_) flush_locked();
}

bool CooldownStore::try_acquire(const CooldownKey& key, std::int64_t now, std::int64_t window_sec){
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = last_.find(key);
    if (it != last_.end() && now - it->second < window_sec) return false;
    last_[key] = now;
    if (autoflush_) flush_locked();
    return true;
}

std::optional<std::int64_t> CooldownStore::last_fired(const CooldownKey& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = last_.find(key);
    if (it == last_.end()) return std::nullopt;
    return it->second;
}

std::size_t CooldownStore::prune_category(const std::string& category){
    return prune_stale({category}, std::string{});
}

std::size_t CooldownStore::prune_stale(const std::set<std::string>& stale, const std::string& keep){
    std::lock_guard<std::mutex> lk(mtx_);
    std::size_t n = 0;
    for (auto it = last_.begin(); it != last_.end();) {
        const auto& cat = it->first.category;
        if (cat != keep && stale.count(cat)) { it = last_.erase(it); ++n; }
        else ++it;
    }
    if (n && autoflush_) flush_locked();
    return n;
}

std::size_t CooldownStore::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return last_.size();
}

} // namespace state
