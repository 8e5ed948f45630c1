#include <gtest/gtest.h>

#include "landrop/Settings.h"
#include "landrop/config.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

using namespace LanDrop;

class SettingsTest : public LanDropTest::TempDirTest {
protected:
    std::filesystem::path configPath() const { return m_dir / "config" / "config.json"; }
};

/**
 * @test First load writes the defaults to disk
 */
TEST_F(SettingsTest, MissingFileIsCreatedWithDefaults) {
    Settings settings(configPath());
    std::string errorMsg;
    ASSERT_TRUE(settings.load(errorMsg)) << errorMsg;
    EXPECT_TRUE(std::filesystem::exists(configPath()));

    const auto j = nlohmann::json::parse(readFile(configPath()));
    EXPECT_TRUE(j.contains("display_name"));
    EXPECT_TRUE(j.contains("save_folder"));
    EXPECT_EQ(j.value("trace_log", true), false);
    EXPECT_FALSE(settings.saveFolder().empty());
}

TEST_F(SettingsTest, SavedValuesSurviveReload) {
    {
        Settings settings(configPath());
        settings.setDisplayName("kitchen-laptop");
        settings.setUserLabel("Ada");
        settings.setSaveFolder(m_dir / "incoming");
        settings.setTraceLogEnabled(true);
        settings.setSeparateIpv4Listener(true);
        std::string errorMsg;
        ASSERT_TRUE(settings.save(errorMsg)) << errorMsg;
    }

    Settings reloaded(configPath());
    std::string errorMsg;
    ASSERT_TRUE(reloaded.load(errorMsg)) << errorMsg;
    EXPECT_EQ(reloaded.displayName(), "kitchen-laptop");
    EXPECT_EQ(reloaded.userLabel(), "Ada");
    EXPECT_EQ(reloaded.saveFolder(), m_dir / "incoming");
    EXPECT_TRUE(reloaded.traceLogEnabled());
    EXPECT_TRUE(reloaded.separateIpv4Listener());
}

TEST_F(SettingsTest, CorruptFileKeepsDefaults) {
    std::filesystem::create_directories(configPath().parent_path());
    writeFile(configPath(), "{ not json");

    Settings settings(configPath());
    const std::string defaultName = settings.displayName();

    std::string errorMsg;
    EXPECT_FALSE(settings.load(errorMsg));
    EXPECT_FALSE(errorMsg.empty());
    EXPECT_EQ(settings.displayName(), defaultName);
    EXPECT_FALSE(settings.traceLogEnabled());
}

TEST_F(SettingsTest, WrongTypesAndEmptyStringsAreIgnored) {
    std::filesystem::create_directories(configPath().parent_path());
    writeFile(configPath(), R"({"display_name": "", "save_folder": 42, "trace_log": "yes"})");

    Settings settings(configPath());
    const std::string defaultName = settings.displayName();
    const auto defaultFolder = settings.saveFolder();

    std::string errorMsg;
    ASSERT_TRUE(settings.load(errorMsg)) << errorMsg;
    EXPECT_EQ(settings.displayName(), defaultName);
    EXPECT_EQ(settings.saveFolder(), defaultFolder);
    EXPECT_FALSE(settings.traceLogEnabled());
}

TEST_F(SettingsTest, LongDisplayNameIsClamped) {
    Settings settings(configPath());
    settings.setDisplayName(std::string(MAX_DISPLAY_NAME + 20, 'x'));
    EXPECT_EQ(settings.displayName().size(), MAX_DISPLAY_NAME);
}
