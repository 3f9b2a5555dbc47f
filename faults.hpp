#pragma once
#include <stdexcept>
#include <string>

// ------------------------------------------------------------
// Fault types. Each carries the error catalog code used when it
// is reported through ErrorManager.
// ------------------------------------------------------------
class Fault : public std::runtime_error {
public:
    Fault(std::string code, const std::string& what)
        : std::runtime_error(what), code_(std::move(code)) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

// Malformed or invalid configuration (file or reload payload)
class ConfigError : public Fault {
public:
    explicit ConfigError(const std::string& what,
                         std::string code = "ERR_CONFIG_INVALID")
        : Fault(std::move(code), what) {}
};

// Required keys are missing from an otherwise readable file
class ConfigSchemaError : public ConfigError {
public:
    explicit ConfigSchemaError(const std::string& what)
        : ConfigError(what, "ERR_CONFIG_MISSING_KEYS") {}
};

// Audio source failure; the loop cannot continue without frames
class DeviceFault : public Fault {
public:
    explicit DeviceFault(const std::string& what,
                         std::string code = "ERR_DEVICE_FAULT")
        : Fault(std::move(code), what) {}
};

// Scoring backend failed to load or to process a frame
class ScoringFault : public Fault {
public:
    explicit ScoringFault(const std::string& what,
                          std::string code = "ERR_SCORING_FAULT")
        : Fault(std::move(code), what) {}
};

// A single command could not be parsed or launched
class DispatchFault : public Fault {
public:
    explicit DispatchFault(const std::string& what,
                           std::string code = "ERR_DISPATCH_FAILED")
        : Fault(std::move(code), what) {}
};
