//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger state, line formatting, and console/file sinks.
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>

#include "env/EnvVars.h"
#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
std::atomic<bool> Logger::sConsoleStderr{false};

namespace {

bool envFlag(const char* name, const char* defaultValue) {
    std::string v = GetEnvOrDefault(name, defaultValue);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "yes";
}

// "2025-06-18 09:30:12,345"
std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::format("{},{:03}", buf, millis);
}

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

bool Logger::setLogLevelFromString(const std::string& lvl) {
    std::string s = lvl;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if (s == "DEBUG") {
        sLogLevel = LogLevel::LOG_DEBUG_LEVEL;
    } else if (s == "INFO") {
        sLogLevel = LogLevel::LOG_INFO_LEVEL;
    } else if (s == "WARN" || s == "WARNING") {
        sLogLevel = LogLevel::LOG_WARN_LEVEL;
    } else if (s == "ERROR") {
        sLogLevel = LogLevel::LOG_ERROR_LEVEL;
    } else {
        return false;
    }
    return true;
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (" << std::strerror(errno) << ")" << std::endl;
        return false;
    }
    sLogFile << "\n=== Log opened at " << timestamp() << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // Colour applies to the console label only, controlled by DORIS_MCP_LOG_COLOR
    static const bool colorEnabled = envFlag("DORIS_MCP_LOG_COLOR", "1");
    // DORIS_MCP_STDIO_MODE=1 keeps stdout clean even before the stdio transport starts
    static const bool envStderr = envFlag("DORIS_MCP_STDIO_MODE", "0");

    const std::string stamp = timestamp();
    const std::string body = std::format("{}:{}: {}\n", baseName(file), line, msg);

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = (envStderr || sConsoleStderr.load()) ? std::cerr : std::cout;
    if (colorEnabled) {
        const char* labelColor = (std::strncmp(level, "ERROR", 5) == 0) ? "\033[38;5;88m" : "\033[35m";
        console << stamp << " [" << labelColor << level << "\033[0m] " << body;
    } else {
        console << stamp << " [" << level << "] " << body;
    }
    console.flush();

    if (sLogFile.is_open()) {
        sLogFile << stamp << " [" << level << "] " << body;
        sLogFile.flush();
    }
}
