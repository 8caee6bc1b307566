#pragma once
#include <string>
#include "telemetry/notifier.hpp"

namespace telemetry {

struct TelegramConfig {
    std::string token;
    std::string chat_id;
    std::string api{"https://api.telegram.org"};
    int timeout_ms{5000};

    bool valid() const { return !token.empty() && !chat_id.empty(); }
};

// POST /bot<token>/sendMessage
class TelegramNotifier final : public INotifier {
public:
    explicit TelegramNotifier(TelegramConfig cfg) : cfg_(std::move(cfg)) {}
    bool send(const std::string& text) override;

private:
    TelegramConfig cfg_;
};

} // namespace telemetry
