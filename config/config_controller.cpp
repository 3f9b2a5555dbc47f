#include "config/config_controller.hpp"
#include "config/config_loader.hpp"
#include "error_manager.hpp"
#include "faults.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

ConfigController::ConfigController(Config initial) {
    publish(std::move(initial));
}

ConfigPtr ConfigController::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

ConfigPtr ConfigController::publish(Config next) {
    std::lock_guard<std::mutex> lock(mutex_);
    next.version = nextVersion_++;
    // Built completely before it becomes visible
    active_ = std::make_shared<const Config>(std::move(next));
    return active_;
}

ReloadResult ConfigController::reload(const nlohmann::json& document,
                                      const PrepareHook& prepare,
                                      const std::string& origin) {
    return apply([&]() { return config_loader::fromJson(document, origin); }, prepare, origin);
}

ReloadResult ConfigController::reloadFromFile(const std::filesystem::path& path,
                                              const PrepareHook& prepare) {
    return apply([&]() { return config_loader::readConfig(path); }, prepare, path.string());
}

ReloadResult ConfigController::apply(const std::function<Config()>& build,
                                     const PrepareHook& prepare,
                                     const std::string& origin) {
    ReloadResult result;
    ConfigPtr previous = current();

    try {
        Config candidate = build();
        if (prepare) {
            prepare(candidate, *previous);
        }
        result.active = publish(std::move(candidate));
        result.accepted = true;
    } catch (const Fault& e) {
        result.message = e.what();
        ErrorManager::report(e.code(), e.what(), LogLevel::Error);
    } catch (const std::exception& e) {
        result.message = e.what();
        ErrorManager::report("ERR_CONFIG_INVALID", e.what(), LogLevel::Error);
    }

    if (!result.accepted) {
        result.active = current();
        ErrorManager::report("ERR_RELOAD_REJECTED",
                             "source=" + origin + " active_version=" +
                             std::to_string(result.active->version),
                             LogLevel::Error);
        return result;
    }

    LOG_INFO("Reload", "Configuration applied version=" + std::to_string(result.active->version) +
                       " source=" + origin +
                       " labels=" + std::to_string(result.active->detection.modelPaths.size()));
    return result;
}
