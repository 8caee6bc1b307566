#pragma once
#include <string>

namespace telemetry {

// Notification channel. send() never throws; false = delivery failed.
class INotifier {
public:
    virtual ~INotifier() = default;
    virtual bool send(const std::string& text) = 0;
};

// Logs instead of delivering (dry runs, missing credentials)
class LogNotifier final : public INotifier {
public:
    bool send(const std::string& text) override;
};

} // namespace telemetry
