#include "common/logger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cstring>  // for strerror
#include <cerrno>   // for errno

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::echoToConsole_ = true;
std::string Logger::logPath_;
std::ofstream Logger::file_;

bool Logger::initialize(const std::string& logPath, LogLevel level, bool echoToConsole) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        std::cerr << "Logger already initialized with " << logPath_ << std::endl;
        return false;
    }

    try {
        std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
        if (!logDir.empty() && !std::filesystem::exists(logDir)) {
            std::filesystem::create_directories(logDir);
        }

        file_.open(logPath, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
            return false;
        }

        logPath_ = logPath;
        currentLevel_ = level;
        echoToConsole_ = echoToConsole;
        initialized_ = true;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return false;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        file_.flush();
        file_.close();
        initialized_ = false;
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

LogLevel Logger::getLogLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLevel_;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || level < currentLevel_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm localTm{};
    localtime_r(&time, &localTm);

    std::ostringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S")
       << " [" << levelToString(level) << "] " << message << "\n";
    const std::string logMessage = ss.str();

    if (level >= LogLevel::ERROR) {
        std::cerr << logMessage;
        std::cerr.flush();
    } else if (echoToConsole_) {
        std::cout << logMessage;
        std::cout.flush();
    }

    file_ << logMessage;
    file_.flush();
    if (!file_) {
        std::cerr << "Failed to write log file " << logPath_ << std::endl;
        file_.clear();
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        level = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else if (upper == "FATAL") {
        level = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}
