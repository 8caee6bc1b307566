#include "telemetry/notifier.hpp"
#include <spdlog/spdlog.h>

namespace telemetry {

bool LogNotifier::send(const std::string& text){
    spdlog::info("[notify]\n{}", text);
    return true;
}

} // namespace telemetry
