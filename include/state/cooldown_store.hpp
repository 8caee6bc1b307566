#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace state {

// (subject, category), e.g. ("EUR_USD", "London") or ("ALL", "strength_alert")
struct CooldownKey {
    std::string subject;
    std::string category;

    std::string str() const { return subject + "|" + category; }
    static std::optional<CooldownKey> parse(const std::string& s);

    bool operator<(const CooldownKey& o) const {
        return subject < o.subject || (subject == o.subject && category < o.category);
    }
    bool operator==(const CooldownKey& o) const {
        return subject == o.subject && category == o.category;
    }
};

// Durable key -> last-fired UNIX timestamp. Thread safe.
// Persistence failures are logged; the store keeps working in memory.
class CooldownStore {
public:
    // Empty path: memory only
    explicit CooldownStore(std::string path = {}, bool autoflush = true);
    ~CooldownStore();

    CooldownStore(const CooldownStore&) = delete;
    CooldownStore& operator=(const CooldownStore&) = delete;

    // Replaces the in-memory state with the file contents. Missing file -> true, empty store.
    bool load();
    bool flush();

    bool is_allowed(const CooldownKey& key, std::int64_t now, std::int64_t window_sec) const;
    void record(const CooldownKey& key, std::int64_t now);

    // is_allowed + record under one lock; true if the caller now owns the slot
    bool try_acquire(const CooldownKey& key, std::int64_t now, std::int64_t window_sec);

    std::optional<std::int64_t> last_fired(const CooldownKey& key) const;

    // Drops every key of `category`; returns the number removed
    std::size_t prune_category(const std::string& category);

    // Drops keys whose category is in `stale` unless it is also `keep`
    std::size_t prune_stale(const std::set<std::string>& stale, const std::string& keep);

    std::size_t size() const;

private:
    bool flush_locked();

    std::string path_;
    bool autoflush_{true};
    mutable std::mutex mtx_;
    std::map<CooldownKey, std::int64_t> last_;
};

} // namespace state
