#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <vector>
#include <filesystem>
#include <chrono>
#include <ctime>

// =====================================================
// Globals
// =====================================================
PhaseInfo g_phaseInfo{};
static std::mutex g_logMutex;
static std::atomic<int> g_minLevel{static_cast<int>(LogLevel::Info)};

// Buffer for grouped phase logging
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;

// File output stream
static std::ofstream g_logFile;

// =====================================================
// Helpers
// =====================================================
static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

static std::string fileBaseName(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << std::endl;
    }

    // stderr ends up in the journal when running under systemd
    std::cerr << line << std::endl;
}

// =====================================================
// Levels
// =====================================================
bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });

    if (up == "DEBUG")                          { out = LogLevel::Debug; return true; }
    if (up == "INFO")                           { out = LogLevel::Info;  return true; }
    if (up == "WARNING" || up == "WARN")        { out = LogLevel::Warn;  return true; }
    if (up == "ERROR" || up == "CRITICAL")      { out = LogLevel::Error; return true; }
    return false;
}

std::string logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void setLogLevel(LogLevel level) {
    g_minLevel.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_minLevel.load());
}

// =====================================================
// Buffering controls
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_buffering = true;
    g_phaseBuffer.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (auto& line : g_phaseBuffer) {
        writeLine(line);
    }
    g_phaseBuffer.clear();
    g_buffering = false;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    std::lock_guard<std::mutex> lock(g_logMutex);

    g_phaseInfo = {std::chrono::system_clock::now(), fileBaseName(file), phase, success};

    // Failed phases are always shown; successful ones are INFO
    if (success && getLogLevel() > LogLevel::Info) {
        return;
    }

    // [ts][PHASE][bootstrap.cpp] Config loaded ok=true
    std::string entry = "[" + formatTimestamp(g_phaseInfo.timestamp) + "][PHASE][" +
                        g_phaseInfo.fileName + "] " + g_phaseInfo.phaseName +
                        (g_phaseInfo.success ? " ok=true" : " ok=false");

    if (g_buffering) g_phaseBuffer.push_back(std::move(entry));
    else writeLine(entry);
}

// =====================================================
// Leveled Logging
// =====================================================
void logMessage(LogLevel level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_minLevel.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine("[" + nowTimestamp() + "][" + logLevelName(level) + "][" + tag + "] " + msg);
}

// =====================================================
// Lifecycle
// =====================================================
namespace fs = std::filesystem;

bool initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (g_logFile.is_open()) g_logFile.close();

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);
    if (!g_logFile.is_open()) {
        std::cerr << "[" << nowTimestamp() << "][ERROR][Logger] Cannot open log file "
                  << logPath.string() << std::endl;
        return false;
    }

    writeLine("[" + nowTimestamp() + "][INFO][Logger] Appending to " + logPath.string());
    return true;
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile.flush();
        g_logFile.close();
    }
}
