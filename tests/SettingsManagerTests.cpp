/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/GameTuning.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

using namespace DinerEngine;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_tuning.json";

    SettingsTestFixture() {
        DINER_ENABLE_QUIET_MODE();
        std::filesystem::create_directories("tests/test_data");
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        SettingsManager::Instance().clearAll();
        DINER_DISABLE_QUIET_MODE();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
        file.close();
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("graphics", "resolution_width", 1920));
    BOOST_CHECK_EQUAL(settings.get<int>("graphics", "resolution_width", 0), 1920);

    // Default value when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("graphics", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloat) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("stove", "cook_time", 4.5f));
    BOOST_CHECK_CLOSE(settings.get<float>("stove", "cook_time", 0.0f), 4.5f, 0.001f);
    BOOST_CHECK_CLOSE(settings.get<float>("stove", "nonexistent", 1.0f), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestIntSatisfiesFloat) {
    auto& settings = SettingsManager::Instance();
    BOOST_CHECK(settings.set("player", "speed", 350));
    BOOST_CHECK_CLOSE(settings.get<float>("player", "speed", 0.0f), 350.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestWrongTypeReturnsDefault) {
    auto& settings = SettingsManager::Instance();
    BOOST_CHECK(settings.set("player", "name", "chef"));
    BOOST_CHECK_EQUAL(settings.get<int>("player", "name", 7), 7);
    BOOST_CHECK_EQUAL(settings.get<std::string>("player", "name", ""), "chef");
}

BOOST_AUTO_TEST_CASE(TestLoadTypesLeaves) {
    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromString(R"({
        "customer": { "wait_time": 12.5, "barrage_count": 6 },
        "graphics": { "vsync": true, "title": "Diner" }
    })"));

    BOOST_CHECK_CLOSE(settings.get<float>("customer", "wait_time", 0.0f), 12.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<int>("customer", "barrage_count", 0), 6);
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", false), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("graphics", "title", ""), "Diner");
}

BOOST_AUTO_TEST_CASE(TestInvalidJsonKeepsValues) {
    auto& settings = SettingsManager::Instance();
    BOOST_CHECK(settings.set("stove", "cook_time", 3.0f));

    createTestFile("{ \"stove\": { \"cook_time\": ");
    BOOST_CHECK(!settings.loadFromFile(testFile));
    BOOST_CHECK_CLOSE(settings.get<float>("stove", "cook_time", 0.0f), 3.0f, 0.001f);

    BOOST_CHECK(!settings.loadFromFile("tests/test_data/does_not_exist.json"));
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload) {
    auto& settings = SettingsManager::Instance();
    BOOST_CHECK(settings.set("seat", "size", 40));
    BOOST_CHECK(settings.set("frame", "max_delta", 0.5f));
    BOOST_CHECK(settings.set("graphics", "vsync", false));
    BOOST_REQUIRE(settings.saveToFile(testFile));

    settings.clearAll();
    BOOST_CHECK(!settings.has("seat", "size"));

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("seat", "size", 0), 40);
    BOOST_CHECK_CLOSE(settings.get<float>("frame", "max_delta", 0.0f), 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", true), false);
}

BOOST_AUTO_TEST_CASE(TestRemoveAndEnumerate) {
    auto& settings = SettingsManager::Instance();
    BOOST_CHECK(settings.set("player", "speed", 400.0f));
    BOOST_CHECK(settings.set("player", "health", 3));
    BOOST_CHECK(settings.set("stove", "size", 64.0f));

    auto categories = settings.getCategories();
    BOOST_CHECK_EQUAL(categories.size(), 2u);
    BOOST_CHECK(std::find(categories.begin(), categories.end(), "player") != categories.end());
    BOOST_CHECK_EQUAL(settings.getKeys("player").size(), 2u);

    BOOST_CHECK(settings.remove("player", "speed"));
    BOOST_CHECK(!settings.remove("player", "speed"));
    BOOST_CHECK(!settings.has("player", "speed"));
}

BOOST_AUTO_TEST_CASE(TestTuningFromSettings) {
    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromString(R"({
        "player": { "speed": 500, "health": 5 },
        "customer": { "fire_time": 1.5 },
        "input": { "click_latch_frames": 900 }
    })"));

    const GameTuning tuning = GameTuning::fromSettings(settings);
    BOOST_CHECK_CLOSE(tuning.playerSpeed, 500.0f, 0.001f);
    BOOST_CHECK_EQUAL(tuning.playerHealth, 5u);
    BOOST_CHECK_CLOSE(tuning.fireTime, 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(static_cast<int>(tuning.clickLatchFrames), 255);

    // Untouched fields keep their defaults
    const GameTuning defaults;
    BOOST_CHECK_CLOSE(tuning.cookTime, defaults.cookTime, 0.001f);
    BOOST_CHECK_EQUAL(tuning.barrageCount, defaults.barrageCount);
}

BOOST_AUTO_TEST_SUITE_END()
