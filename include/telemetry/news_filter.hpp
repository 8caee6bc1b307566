#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace telemetry {

// Economic calendar entry
struct NewsEvent {
    std::string id;          // stable identity, used for dedup
    std::int64_t time{0};    // UNIX seconds
    std::string currency;
    std::string impact;      // "High", "Medium", "Low"
    std::string title;
};

// Calendar feed collaborator; the core does not parse feeds itself
class IEventSource {
public:
    virtual ~IEventSource() = default;
    virtual std::vector<NewsEvent> events() = 0;
};

struct NewsFilterConfig {
    std::set<std::string> impacts{"High", "Medium"};
    std::int64_t horizon_sec{3600};
};

// Events relevant to the currencies of active trades, starting within the horizon
class NewsFilter {
public:
    explicit NewsFilter(NewsFilterConfig cfg = {}) : cfg_(std::move(cfg)) {}

    std::vector<NewsEvent> relevant(const std::vector<NewsEvent>& events,
                                    const std::set<std::string>& currencies,
                                    std::int64_t now) const;

    static std::string format(const NewsEvent& ev, const std::string& pairs);

private:
    NewsFilterConfig cfg_;
};

} // namespace telemetry
