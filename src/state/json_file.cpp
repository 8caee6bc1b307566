#include "state/json_file.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace state {

std::optional<nlohmann::json> read_json_file(const std::string& path){
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;
    std::ifstream f(path);
    if (!f.good()) {
        spdlog::error("Cannot open state file {}", path);
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Corrupt state file {}: {}", path, e.what());
        return std::nullopt;
    }
}

bool write_json_file(const std::string& path, const nlohmann::json& j){
    const std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.good()) {
            spdlog::error("Cannot write state file {}", tmp);
            return false;
        }
        f << j.dump(2);
        f.flush();
        if (!f.good()) {
            spdlog::error("Write to {} failed", tmp);
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        spdlog::error("Cannot replace {}: {}", path, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace state
