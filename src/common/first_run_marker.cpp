#include "common/first_run_marker.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <system_error>

bool FirstRunMarker::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

bool FirstRunMarker::mark() {
    try {
        std::filesystem::path dir = std::filesystem::path(path_).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }

        std::ofstream file(path_, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            lastError_ = "Failed to create first run marker: " + path_;
            Logger::error(lastError_);
            return false;
        }

        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm utcTm{};
        gmtime_r(&now, &utcTm);
        file << std::put_time(&utcTm, "%Y-%m-%dT%H:%M:%SZ");
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to create first run marker: " + std::string(e.what());
        Logger::error(lastError_);
        return false;
    }
}
