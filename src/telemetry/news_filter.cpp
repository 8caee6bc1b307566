#include "telemetry/news_filter.hpp"
#include <fmt/format.h>
#include "core/session.hpp"

namespace telemetry {

std::vector<NewsEvent> NewsFilter::relevant(const std::vector<NewsEvent>& events,
                                            const std::set<std::string>& currencies,
                                            std::int64_t now) const {
    std::vector<NewsEvent> out;
    for (const auto& ev : events) {
        if (!currencies.count(ev.currency)) continue;
        if (!cfg_.impacts.count(ev.impact)) continue;
        const std::int64_t until = ev.time - now;
        if (until >= 0 && until <= cfg_.horizon_sec) out.push_back(ev);
    }
    return out;
}

std::string NewsFilter::format(const NewsEvent& ev, const std::string& pairs){
    return fmt::format("News Alert for {} trade!\n{} - {} ({})\nTime: {}",
                       pairs, ev.currency, ev.title, ev.impact, core::format_utc(ev.time));
}

} // namespace telemetry
