#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json_fwd.hpp>

#include "config/config_types.hpp"

using ConfigPtr = std::shared_ptr<const Config>;

struct ReloadResult {
    bool accepted = false;
    std::string message;   // rejection reason, empty when accepted
    ConfigPtr active;      // snapshot in effect after the call
};

/// ConfigController
/// Owns the active snapshot. Readers take a shared_ptr copy and keep using
/// that object for as long as they need; a publish never touches a snapshot
/// that is already out.
class ConfigController {
public:
    // Called with (candidate, active) after validation and before publishing.
    // Throwing rejects the reload.
    using PrepareHook = std::function<void(const Config& candidate, const Config& active)>;

    explicit ConfigController(Config initial);

    ConfigPtr current() const;

    // Swap in a fully built snapshot; returns it with its version assigned
    ConfigPtr publish(Config next);

    // Validate a candidate document, run `prepare`, publish.
    // Any failure leaves the active snapshot in place and is logged.
    ReloadResult reload(const nlohmann::json& document,
                        const PrepareHook& prepare = {},
                        const std::string& origin = "<reload>");

    // Same, reading the TOML file at `path`
    ReloadResult reloadFromFile(const std::filesystem::path& path,
                                const PrepareHook& prepare = {});

private:
    ReloadResult apply(const std::function<Config()>& build,
                       const PrepareHook& prepare,
                       const std::string& origin);

    mutable std::mutex mutex_;
    ConfigPtr active_;
    std::uint64_t nextVersion_ = 1;
};
