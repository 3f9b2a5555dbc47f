/**
 * @file test_config_controller.cpp
 * @brief Snapshot publishing and reload acceptance / rejection
 */

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "config/config_controller.hpp"
#include "config/config_loader.hpp"
#include "faults.hpp"
#include "tests/test_support.hpp"

// =============================================================================
// PUBLISH
// =============================================================================

TEST(ConfigController, VersionsIncreaseOnPublish) {
    vltest::TempDir dir;
    ConfigController controller(vltest::makeConfig(dir, {"Open_Editor"}));

    ConfigPtr first = controller.current();
    EXPECT_EQ(first->version, 1u);

    ConfigPtr second = controller.publish(vltest::makeConfig(dir, {"Open_Editor"}));
    EXPECT_EQ(second->version, 2u);
    EXPECT_EQ(controller.current(), second);

    // A reader's snapshot is never touched by later publishes
    EXPECT_EQ(first->version, 1u);
}

TEST(ConfigController, ConcurrentReadersNeverSeeMixedSnapshots) {
    vltest::TempDir dir;
    Config a = vltest::makeConfig(dir, {"Open_Editor"});
    a.detection.sensitivity = 0.2;
    a.detection.cooldownSecs = 2.0;
    a.audio.chunkSize = 1280;

    Config b = a;
    b.detection.sensitivity = 0.8;
    b.detection.cooldownSecs = 8.0;
    b.audio.chunkSize = 2560;

    ConfigController controller(a);
    std::atomic<bool> done{false};
    std::atomic<int> mixed{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; i++) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                ConfigPtr cfg = controller.current();
                bool isA = cfg->detection.sensitivity == 0.2 && cfg->detection.cooldownSecs == 2.0 &&
                           cfg->audio.chunkSize == 1280;
                bool isB = cfg->detection.sensitivity == 0.8 && cfg->detection.cooldownSecs == 8.0 &&
                           cfg->audio.chunkSize == 2560;
                if (!isA && !isB) mixed++;
            }
        });
    }

    for (int i = 0; i < 2000; i++) {
        controller.publish(i % 2 ? a : b);
    }
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(mixed.load(), 0);
    EXPECT_EQ(controller.current()->version, 2001u);
}

// =============================================================================
// RELOAD
// =============================================================================

TEST(ConfigController, ValidReloadIsPublished) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    ConfigController controller(config_loader::fromJson(doc));

    doc["general"]["sensitivity"] = 0.75;
    ReloadResult result = controller.reload(doc);

    EXPECT_TRUE(result.accepted);
    EXPECT_TRUE(result.message.empty());
    EXPECT_EQ(result.active->version, 2u);
    EXPECT_DOUBLE_EQ(controller.current()->detection.sensitivity, 0.75);
}

TEST(ConfigController, OutOfRangeSensitivityKeepsPriorSnapshot) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    ConfigController controller(config_loader::fromJson(doc));
    ConfigPtr before = controller.current();

    doc["general"]["sensitivity"] = 1.7;
    ReloadResult result = controller.reload(doc);

    EXPECT_FALSE(result.accepted);
    EXPECT_NE(result.message.find("general.sensitivity"), std::string::npos);
    EXPECT_EQ(result.active, before);
    EXPECT_EQ(controller.current(), before);
    EXPECT_DOUBLE_EQ(controller.current()->detection.sensitivity, 0.5);
}

TEST(ConfigController, MissingKeysRejected) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    ConfigController controller(config_loader::fromJson(doc));

    doc.erase("audio");
    EXPECT_FALSE(controller.reload(doc).accepted);
    EXPECT_EQ(controller.current()->version, 1u);
}

TEST(ConfigController, PrepareHookSeesCandidateAndActive) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    ConfigController controller(config_loader::fromJson(doc));

    doc["audio"]["chunk_size"] = 2560;
    int seenCandidate = 0;
    int seenActive = 0;
    ReloadResult result = controller.reload(doc, [&](const Config& candidate, const Config& active) {
        seenCandidate = candidate.audio.chunkSize;
        seenActive = active.audio.chunkSize;
    });

    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(seenCandidate, 2560);
    EXPECT_EQ(seenActive, 1280);
}

TEST(ConfigController, ThrowingPrepareHookRejects) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    ConfigController controller(config_loader::fromJson(doc));

    doc["general"]["sensitivity"] = 0.9;
    ReloadResult faulted = controller.reload(doc, [](const Config&, const Config&) {
        throw DeviceFault("cannot reopen", "ERR_DEVICE_OPEN");
    });
    EXPECT_FALSE(faulted.accepted);
    EXPECT_EQ(faulted.message, "cannot reopen");

    ReloadResult generic = controller.reload(doc, [](const Config&, const Config&) {
        throw std::runtime_error("boom");
    });
    EXPECT_FALSE(generic.accepted);

    EXPECT_DOUBLE_EQ(controller.current()->detection.sensitivity, 0.5);
    EXPECT_EQ(controller.current()->version, 1u);
}

TEST(ConfigController, ReloadFromFile) {
    vltest::TempDir dir;
    nlohmann::json doc = vltest::makeDocument(dir, {"Open_Editor"});
    ConfigController controller(config_loader::fromJson(doc));

    std::filesystem::path path = dir.path() / "config.toml";
    doc["general"]["launch_cooldown_secs"] = 9.5;
    config_loader::writeConfig(path, doc);

    ReloadResult result = controller.reloadFromFile(path);
    EXPECT_TRUE(result.accepted);
    EXPECT_DOUBLE_EQ(controller.current()->detection.cooldownSecs, 9.5);

    EXPECT_FALSE(controller.reloadFromFile(dir.path() / "missing.toml").accepted);
    EXPECT_DOUBLE_EQ(controller.current()->detection.cooldownSecs, 9.5);
}
