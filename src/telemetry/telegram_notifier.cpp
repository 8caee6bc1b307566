#include "telemetry/telegram_notifier.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace telemetry {

bool TelegramNotifier::send(const std::string& text){
    if (!cfg_.valid()) {
        spdlog::error("Telegram token/chat id missing, message dropped");
        return false;
    }
    try {
        cpr::Response r = cpr::Post(cpr::Url{cfg_.api + "/bot" + cfg_.token + "/sendMessage"},
                                    cpr::Payload{{"chat_id", cfg_.chat_id}, {"text", text}},
                                    cpr::Timeout{cfg_.timeout_ms},
                                    cpr::VerifySsl{true});
        if (r.error) {
            spdlog::error("Failed to send telegram message: {}", r.error.message);
            return false;
        }
        if (r.status_code != 200) {
            spdlog::error("Failed to send telegram message: {} {}", r.status_code, r.text);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to send telegram message: {}", e.what());
        return false;
    }
}

} // namespace telemetry
