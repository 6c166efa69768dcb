// ============================================================================
// log.cpp: implementation for log.hpp
// ============================================================================

#include "xmmrpc/log.hpp"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>

namespace xmmrpc {

namespace {

std::mutex g_log_mtx;
LogSink g_sink;                                   // empty => stderr
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

} // namespace

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

void set_log_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    g_sink = std::move(sink);
}

void log_event(LogLevel lvl, const std::string& event, const std::string& detail) {
    if (static_cast<int>(lvl) < g_level.load()) return;

    std::string line = "level=";
    line += log_level_name(lvl);
    line += " event=";
    line += event;
    if (!detail.empty()) {
        line += ' ';
        line += detail;
    }

    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (g_sink) {
        g_sink(lvl, line);
    } else {
        std::cerr << line << "\n";
    }
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char* DIGITS = "0123456789abcdef";
    std::string s;
    s.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        s.push_back(DIGITS[data[i] >> 4]);
        s.push_back(DIGITS[data[i] & 0x0F]);
    }
    return s;
}

std::string hex32(uint32_t v) {
    static const char* DIGITS = "0123456789abcdef";
    std::string s = "0x";
    for (int shift = 28; shift >= 0; shift -= 4)
        s.push_back(DIGITS[(v >> shift) & 0x0F]);
    return s;
}

} // namespace xmmrpc
