/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only. Debug builds print straight to stdout from Logger.hpp.
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <string_view>
#include <vector>

#ifndef SENTINEL_APP_NAME
#define SENTINEL_APP_NAME "SentinelEngine"
#endif

namespace SentinelEngine {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view SESSION_PREFIX = "sentinel_";
constexpr size_t SESSIONS_KEPT = 5;
constexpr size_t FLUSH_EVERY = 50;

std::tm localTime(std::time_t when) {
    std::tm parts{};
#ifdef _WIN32
    localtime_s(&parts, &when);
#else
    localtime_r(&when, &parts);
#endif
    return parts;
}

// Removes the oldest session logs so that at most `keep` remain
void pruneSessions(const fs::path& dir, size_t keep) {
    std::error_code ec;
    std::vector<fs::path> sessions;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const fs::path& path = entry.path();
        if (path.extension() == ".log" && path.filename().string().starts_with(SESSION_PREFIX)) {
            sessions.push_back(path);
        }
    }
    if (sessions.size() <= keep) {
        return;
    }

    // Session names embed their start time, so name order is age order
    std::sort(sessions.begin(), sessions.end());
    for (size_t i = 0; i + keep < sessions.size(); ++i) {
        fs::remove(sessions[i], ec);
    }
}

/**
 * One log file per run under <pref path>/logs. Opened lazily on the first
 * CRITICAL or ERROR so clean runs leave nothing behind.
 */
class SessionLog {
public:
    static SessionLog& get() {
        static SessionLog log;
        return log;
    }

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    void append(std::string_view level, std::string_view system, std::string_view message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_file.is_open()) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const std::tm parts = localTime(std::chrono::system_clock::to_time_t(now));
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

        m_file << std::format("{:02}:{:02}:{:02}.{:03} {:<8} [{}] {}\n", parts.tm_hour, parts.tm_min,
                              parts.tm_sec, millis, level, system, message);

        if (level == "CRITICAL" || ++m_pending >= FLUSH_EVERY) {
            m_file.flush();
            m_pending = 0;
        }
    }

private:
    SessionLog() = default;
    ~SessionLog() {
        if (m_file.is_open()) {
            m_file.flush();
        }
    }

    void open() {
        m_opened = true;

        char* prefPath = SDL_GetPrefPath("SentinelForged", SENTINEL_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        const fs::path dir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return;
        }
        pruneSessions(dir, SESSIONS_KEPT - 1);

        const std::tm start = localTime(std::time(nullptr));
        const std::string name =
            std::format("{}{:04}{:02}{:02}_{:02}{:02}{:02}.log", SESSION_PREFIX, start.tm_year + 1900,
                        start.tm_mon + 1, start.tm_mday, start.tm_hour, start.tm_min, start.tm_sec);

        m_file.open(dir / name, std::ios::out | std::ios::app);
        if (m_file.is_open()) {
            m_file << std::format("# {} session {:04}-{:02}-{:02}\n", SENTINEL_APP_NAME, start.tm_year + 1900,
                                  start.tm_mon + 1, start.tm_mday);
        }
    }

    std::mutex m_mutex;
    std::ofstream m_file;
    bool m_opened{false};
    size_t m_pending{0};
};

} // namespace

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    SessionLog::get().append(level, system, message);
}

} // namespace SentinelEngine

#endif // DEBUG
