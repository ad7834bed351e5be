#include "common/Logging.h"

#include <unistd.h>

#include <atomic>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace deskrelay::common {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_mu;
std::ofstream g_file;

const char* color_of(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "\033[36m";
        case LogLevel::Info:    return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error:   return "\033[31m";
    }
    return "";
}

} // namespace

bool Logging::init(LogLevel level, const std::string& logFile) {
    set_level(level);

    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) g_file.close();
    if (logFile.empty()) return true;

    g_file.open(logFile, std::ios::out | std::ios::app);
    if (!g_file.is_open()) {
        std::cerr << "[deskrelay] could not open log file " << logFile << ", using console\n";
        return false;
    }
    return true;
}

void Logging::shutdown() {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) {
        g_file.flush();
        g_file.close();
    }
}

void Logging::set_level(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logging::level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool Logging::enabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

const char* Logging::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
    }
    return "?????";
}

std::optional<LogLevel> Logging::parse_level(std::string_view name) {
    std::string s(name);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warning;
    if (s == "error") return LogLevel::Error;
    return std::nullopt;
}

void Logging::write(LogLevel level, std::string_view component, std::string_view text) {
    if (!enabled(level)) return;

    std::time_t now = std::time(nullptr);
    std::tm tm_info{};
    localtime_r(&now, &tm_info);
    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_info);

    std::lock_guard<std::mutex> lk(g_mu);

    if (g_file.is_open()) {
        g_file << timestamp << " [deskrelay] [" << level_name(level) << "] ["
               << component << "] " << text << '\n';
        g_file.flush();
        return;
    }

    const bool to_err = level == LogLevel::Error;
    std::ostream& out = to_err ? std::cerr : std::cout;
    const bool colors = isatty(to_err ? STDERR_FILENO : STDOUT_FILENO) != 0;

    out << timestamp << " [deskrelay] [";
    if (colors) out << color_of(level) << level_name(level) << "\033[0m";
    else out << level_name(level);
    out << "] [" << component << "] " << text << std::endl;
}

} // namespace deskrelay::common
