#pragma once
#include <string>
#include <chrono>

// =====================================================
// Severity
// =====================================================
enum class LogLevel {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3
};

// Accepts DEBUG, INFO, WARNING/WARN, ERROR, CRITICAL (any case).
// Returns false and leaves `out` untouched for anything else.
bool parseLogLevel(const std::string& name, LogLevel& out);
std::string logLevelName(LogLevel level);

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success;            // true = success, false = failure
};

// Global storage for most recent phase
extern PhaseInfo g_phaseInfo;

// =====================================================
// Lifecycle
// =====================================================
// Console (stderr) output is always on; a file sink is optional.
bool initLogger(const std::string& filename);
void shutdownLogger();

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logMessage(LogLevel level, const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logMessage(LogLevel::Debug, tag, msg)
#define LOG_INFO(tag, msg)  logMessage(LogLevel::Info, tag, msg)
#define LOG_WARN(tag, msg)  logMessage(LogLevel::Warn, tag, msg)
#define LOG_ERROR(tag, msg) logMessage(LogLevel::Error, tag, msg)
