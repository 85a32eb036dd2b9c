#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "config.hpp"

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    std::string path;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("xpadcfg-test-" + std::to_string(getpid()) + "-" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir);
        path = (dir / "nested" / "config.json").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    void write_file(const std::string& text) {
        std::filesystem::create_directories(std::filesystem::path(path).parent_path());
        std::ofstream file(path);
        file << text;
    }
};

TEST_F(ConfigTest, MissingFileLoadsNothing) {
    EXPECT_FALSE(ConfigManager::load(path).has_value());
    EXPECT_FALSE(CommandStore(path).load().has_value());
}

TEST_F(ConfigTest, SaveCreatesDirectoryAndKeepsEverything) {
    Config config;
    config.settings.emulator = "/opt/xboxdrv/bin/xboxdrv";
    config.settings.use_sudo = false;
    config.settings.debounce_ms = 250;
    config.settings.settle_ms = 0;
    config.device_name = "Generic \"USB\" Pad\\2";
    config.command = "xboxdrv --evdev {device} --evdev-keymap KEY_A=a --mimic-xpad --silent";
    config.buttons.bindings.push_back(ButtonBinding{"a", 30, "KEY_A"});
    config.buttons.bindings.push_back(ButtonBinding{"start", 0x13b, "BTN_START"});
    config.axes.bindings.push_back(AxisBinding{"x1", 0, "ABS_X", false});
    config.axes.bindings.push_back(AxisBinding{"y1", 1, "ABS_Y", true});

    ASSERT_TRUE(ConfigManager::save(path, config));
    auto loaded = ConfigManager::load(path);
    ASSERT_TRUE(loaded.has_value());

    EXPECT_EQ(loaded->version, CONFIG_VERSION);
    EXPECT_EQ(loaded->settings.emulator, "/opt/xboxdrv/bin/xboxdrv");
    EXPECT_FALSE(loaded->settings.use_sudo);
    EXPECT_EQ(loaded->settings.debounce_ms, 250);
    EXPECT_EQ(loaded->settings.settle_ms, 0);
    EXPECT_EQ(loaded->device_name, config.device_name);
    EXPECT_EQ(loaded->command, config.command);

    ASSERT_EQ(loaded->buttons.bindings.size(), 2u);
    EXPECT_EQ(loaded->buttons.bindings[1].button, "start");
    EXPECT_EQ(loaded->buttons.bindings[1].code, 0x13b);
    EXPECT_EQ(loaded->buttons.bindings[1].key_name, "BTN_START");

    ASSERT_EQ(loaded->axes.bindings.size(), 2u);
    EXPECT_EQ(loaded->axes.bindings[1].axis, "y1");
    EXPECT_TRUE(loaded->axes.bindings[1].inverted);
    EXPECT_FALSE(loaded->axes.bindings[0].inverted);
}

TEST_F(ConfigTest, DefaultsFillMissingFields) {
    write_file("{\n  \"version\": 1,\n  \"command\": \"xboxdrv --evdev {device}\"\n}\n");

    auto loaded = ConfigManager::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->settings.emulator, "xboxdrv");
    EXPECT_TRUE(loaded->settings.use_sudo);
    EXPECT_EQ(loaded->settings.debounce_ms, 500);
    EXPECT_TRUE(loaded->buttons.bindings.empty());
    EXPECT_EQ(CommandStore(path).load(), "xboxdrv --evdev {device}");
}

TEST_F(ConfigTest, ValueEqualToAKeyIsNotMistakenForIt) {
    write_file("{\"device_name\": \"command\", \"command\": \"xboxdrv\"}");

    auto loaded = ConfigManager::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->device_name, "command");
    EXPECT_EQ(loaded->command, "xboxdrv");
}

TEST_F(ConfigTest, BadNumberFailsTheLoad) {
    write_file("{\"version\": \"one\", \"command\": \"xboxdrv\"}");
    EXPECT_THROW(ConfigManager::load(path), ConfigError);
    EXPECT_THROW(CommandStore(path).load(), ConfigError);
}

TEST_F(ConfigTest, StoreSaveLeavesUnreadableConfigAlone) {
    const std::string original =
        "{\n"
        "  \"version\": 1,\n"
        "  \"settings\": {\"emulator\": \"/opt/xboxdrv\", \"use_sudo\": false, \"debounce_ms\": x5},\n"
        "  \"command\": \"old\",\n"
        "  \"buttons\": [{\"button\": \"a\", \"code\": 30, \"key_name\": \"KEY_A\"}]\n"
        "}\n";
    write_file(original);

    EXPECT_FALSE(CommandStore(path).save("new"));

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_EQ(contents.str(), original);
}

TEST_F(ConfigTest, EmptyCommandCountsAsAbsent) {
    Config config;
    config.buttons.bindings.push_back(ButtonBinding{"a", 30, "KEY_A"});
    ASSERT_TRUE(ConfigManager::save(path, config));

    EXPECT_FALSE(CommandStore(path).load().has_value());
}

TEST_F(ConfigTest, StoreSavePreservesMappings) {
    Config config;
    config.settings.use_sudo = false;
    config.buttons.bindings.push_back(ButtonBinding{"a", 30, "KEY_A"});
    ASSERT_TRUE(ConfigManager::save(path, config));

    CommandStore store(path);
    ASSERT_TRUE(store.save("xboxdrv --evdev {device} --silent"));

    EXPECT_EQ(store.load(), "xboxdrv --evdev {device} --silent");
    auto loaded = store.load_config();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->settings.use_sudo);
    ASSERT_EQ(loaded->buttons.bindings.size(), 1u);
}

TEST(ConfigPathTest, EnvironmentOverride) {
    const char* old = getenv("XPADCFG_CONFIG");
    std::string saved = old ? old : "";

    setenv("XPADCFG_CONFIG", "/tmp/custom-xpadcfg.json", 1);
    EXPECT_EQ(ConfigManager::get_config_path(), "/tmp/custom-xpadcfg.json");

    unsetenv("XPADCFG_CONFIG");
    const char* home = getenv("HOME");
    if (home) {
        EXPECT_EQ(ConfigManager::get_config_path(), std::string(home) + "/.config/xpadcfg/config.json");
    }

    if (old) setenv("XPADCFG_CONFIG", saved.c_str(), 1);
}
