#pragma once
#include <algorithm>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>
#include "core/types.hpp"

namespace data {

// Market data collaborator. Never throws; may return fewer candles than
// requested or none at all (market closed, transport failure).
class ICandleSource {
public:
    virtual ~ICandleSource() = default;
    virtual Candles get(const Pair& pair, Timeframe tf, std::size_t count) = 0;
};

// Bounded retry with exponential backoff
struct RetryPolicy {
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    int max_attempts{3};
    std::chrono::milliseconds base_delay{500};
    double factor{2.0};
    Sleeper sleep{[](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); }};

    std::chrono::milliseconds delay_for(int attempt) const {
        double ms = static_cast<double>(base_delay.count());
        for (int i = 1; i < attempt; ++i) ms *= factor;
        return std::chrono::milliseconds(static_cast<long long>(ms));
    }

    // `fn` returns nullopt for a transient failure. After max_attempts the
    // result is nullopt as well.
    template <class Fn>
    auto run(Fn&& fn, const std::string& what) const -> decltype(fn()) {
        const int attempts = std::max(1, max_attempts);
        for (int a = 1; a <= attempts; ++a) {
            auto r = fn();
            if (r) return r;
            if (a < attempts) {
                const auto d = delay_for(a);
                spdlog::warn("{}: attempt {}/{} failed, retrying in {} ms", what, a, attempts, d.count());
                if (sleep) sleep(d);
            }
        }
        spdlog::error("{}: giving up after {} attempts", what, attempts);
        return decltype(fn()){};
    }
};

} // namespace data
