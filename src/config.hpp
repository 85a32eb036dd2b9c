#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>
#include <vector>

#include "mapping.hpp"

// Version marker for the config format
constexpr int CONFIG_VERSION = 1;

struct Settings {
    std::string emulator = "xboxdrv";
    bool use_sudo = true;
    int debounce_ms = 500;   // pause before each axis query
    int settle_ms = 1000;    // pause after a device has been picked
};

struct Config {
    int version = CONFIG_VERSION;
    Settings settings;

    // Name of the controller the mapping was recorded with
    std::string device_name;

    // Emulator command line with the device placeholder still in it
    std::string command;

    ButtonMapping buttons;
    AxisMapping axes;
};

// The config file exists but cannot be read back
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigManager {
public:
    static std::string get_config_path();
    // nullopt when the file does not exist, ConfigError when it does not parse
    static std::optional<Config> load(const std::string& config_path);
    static bool save(const std::string& config_path, const Config& config);

private:
    static std::string escape_json_string(const std::string& str);
    static std::string unescape_json_string(const std::string& str);
    static std::optional<std::string> get_json_value(const std::string& json, std::string_view key);
    static std::vector<std::string> split_objects(const std::string& array);

    static Settings parse_settings(const std::string& json);
    static ButtonMapping parse_buttons(const std::string& json);
    static AxisMapping parse_axes(const std::string& json);
};

// The saved emulator command, backed by the config file
class CommandStore {
public:
    explicit CommandStore(std::string config_path) : config_path(std::move(config_path)) {}

    // Absent when the file is missing or holds no command. A file that
    // does not parse throws ConfigError.
    std::optional<std::string> load() const;

    // Replaces the command, keeping the rest of an existing config. Fails
    // without writing when the existing file does not parse.
    bool save(const std::string& command) const;

    std::optional<Config> load_config() const { return ConfigManager::load(config_path); }
    bool save_config(const Config& config) const { return ConfigManager::save(config_path, config); }

    const std::string& get_path() const { return config_path; }

private:
    std::string config_path;
};
