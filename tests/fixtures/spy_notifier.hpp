#pragma once
#include <string>
#include <vector>
#include "telemetry/notifier.hpp"

/// Records every message; delivery result is configurable
class SpyNotifier : public telemetry::INotifier {
public:
    bool send(const std::string& text) override {
        messages_.push_back(text);
        return deliver_;
    }

    void set_deliver(bool d) { deliver_ = d; }
    const std::vector<std::string>& messages() const { return messages_; }
    std::size_t count() const { return messages_.size(); }

    std::size_t count_containing(const std::string& needle) const {
        std::size_t n = 0;
        for (const auto& m : messages_) if (m.find(needle) != std::string::npos) ++n;
        return n;
    }

private:
    std::vector<std::string> messages_;
    bool deliver_{true};
};
