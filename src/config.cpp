// config.cpp - JSON config holding settings, mappings and the emulator command
#include "config.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

// Get config path from environment or use default
std::string ConfigManager::get_config_path() {
    const char* env_path = getenv("XPADCFG_CONFIG");
    if (env_path && *env_path) {
        return std::string(env_path);
    }

    const char* home = getenv("HOME");
    if (!home) {
        return "/etc/xpadcfg/config.json";
    }

    return std::string(home) + "/.config/xpadcfg/config.json";
}

std::optional<Config> ConfigManager::load(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::error_code ec;
        if (std::filesystem::exists(config_path, ec)) {
            throw ConfigError("cannot read " + config_path);
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    Config config;
    try {
        auto version_opt = get_json_value(json, "version");
        if (version_opt) {
            config.version = std::stoi(*version_opt);
        }

        auto settings_opt = get_json_value(json, "settings");
        if (settings_opt) {
            config.settings = parse_settings(*settings_opt);
        }

        auto name_opt = get_json_value(json, "device_name");
        if (name_opt) config.device_name = unescape_json_string(*name_opt);

        auto command_opt = get_json_value(json, "command");
        if (command_opt) config.command = unescape_json_string(*command_opt);

        auto buttons_opt = get_json_value(json, "buttons");
        if (buttons_opt) config.buttons = parse_buttons(*buttons_opt);

        auto axes_opt = get_json_value(json, "axes");
        if (axes_opt) config.axes = parse_axes(*axes_opt);
    } catch (const std::logic_error& e) {
        // stoi throws invalid_argument / out_of_range on garbage numbers
        throw ConfigError("failed to parse " + config_path + " (bad number: " + e.what() + ")");
    }

    if (config.version > CONFIG_VERSION) {
        std::cerr << "Warning: " << config_path << " has version " << config.version
                  << ", this build understands " << CONFIG_VERSION << "\n";
    }

    return config;
}

bool ConfigManager::save(const std::string& config_path, const Config& config) {
    // Create directory if needed
    std::filesystem::path dir = std::filesystem::path(config_path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "Failed to create " << dir.string() << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        return false;
    }

    file << "{\n";
    file << "  \"version\": " << config.version << ",\n";

    file << "  \"settings\": {\n";
    file << "    \"emulator\": \"" << escape_json_string(config.settings.emulator) << "\",\n";
    file << "    \"use_sudo\": " << (config.settings.use_sudo ? "true" : "false") << ",\n";
    file << "    \"debounce_ms\": " << config.settings.debounce_ms << ",\n";
    file << "    \"settle_ms\": " << config.settings.settle_ms << "\n";
    file << "  },\n";

    file << "  \"device_name\": \"" << escape_json_string(config.device_name) << "\",\n";
    file << "  \"command\": \"" << escape_json_string(config.command) << "\",\n";

    file << "  \"buttons\": [";
    bool first = true;
    for (const auto& binding : config.buttons.bindings) {
        file << (first ? "\n" : ",\n");
        first = false;
        file << "    {\"button\": \"" << escape_json_string(binding.button) << "\", "
             << "\"code\": " << binding.code << ", "
             << "\"key_name\": \"" << escape_json_string(binding.key_name) << "\"}";
    }
    file << (first ? "],\n" : "\n  ],\n");

    file << "  \"axes\": [";
    first = true;
    for (const auto& binding : config.axes.bindings) {
        file << (first ? "\n" : ",\n");
        first = false;
        file << "    {\"axis\": \"" << escape_json_string(binding.axis) << "\", "
             << "\"code\": " << binding.code << ", "
             << "\"axis_name\": \"" << escape_json_string(binding.axis_name) << "\", "
             << "\"inverted\": " << (binding.inverted ? "true" : "false") << "}";
    }
    file << (first ? "]\n" : "\n  ]\n");

    file << "}\n";

    file.close();
    return !file.fail();
}

Settings ConfigManager::parse_settings(const std::string& json) {
    Settings settings;

    auto emulator_opt = get_json_value(json, "emulator");
    if (emulator_opt) settings.emulator = unescape_json_string(*emulator_opt);

    auto sudo_opt = get_json_value(json, "use_sudo");
    if (sudo_opt) settings.use_sudo = (*sudo_opt == "true");

    auto debounce_opt = get_json_value(json, "debounce_ms");
    if (debounce_opt) settings.debounce_ms = std::stoi(*debounce_opt);

    auto settle_opt = get_json_value(json, "settle_ms");
    if (settle_opt) settings.settle_ms = std::stoi(*settle_opt);

    return settings;
}

ButtonMapping ConfigManager::parse_buttons(const std::string& json) {
    ButtonMapping mapping;
    for (const auto& obj : split_objects(json)) {
        ButtonBinding binding;
        binding.button = unescape_json_string(get_json_value(obj, "button").value_or(""));
        binding.code = std::stoi(get_json_value(obj, "code").value_or("0"));
        binding.key_name = unescape_json_string(get_json_value(obj, "key_name").value_or(""));

        if (binding.button.empty() || binding.key_name.empty()) continue;
        mapping.bindings.push_back(binding);
    }
    return mapping;
}

AxisMapping ConfigManager::parse_axes(const std::string& json) {
    AxisMapping mapping;
    for (const auto& obj : split_objects(json)) {
        AxisBinding binding;
        binding.axis = unescape_json_string(get_json_value(obj, "axis").value_or(""));
        binding.code = std::stoi(get_json_value(obj, "code").value_or("0"));
        binding.axis_name = unescape_json_string(get_json_value(obj, "axis_name").value_or(""));
        binding.inverted = get_json_value(obj, "inverted").value_or("false") == "true";

        if (binding.axis.empty() || binding.axis_name.empty()) continue;
        mapping.bindings.push_back(binding);
    }
    return mapping;
}

// Top-level {...} members of a JSON array
std::vector<std::string> ConfigManager::split_objects(const std::string& array) {
    std::vector<std::string> objects;
    int depth = 0;
    bool in_string = false;
    bool escape = false;
    size_t obj_start = 0;

    for (size_t i = 0; i < array.size(); ++i) {
        const char c = array[i];

        if (in_string) {
            if (escape) { escape = false; continue; }
            if (c == '\\') { escape = true; continue; }
            if (c == '"') in_string = false;
            continue;
        }

        if (c == '"') { in_string = true; continue; }
        if (c == '{') {
            if (depth == 0) obj_start = i;
            depth++;
        } else if (c == '}' && depth > 0) {
            depth--;
            if (depth == 0) {
                objects.push_back(array.substr(obj_start, i - obj_start + 1));
            }
        }
    }

    return objects;
}

std::string ConfigManager::escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 10);

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }

    return result;
}

std::string ConfigManager::unescape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '\\' && i + 1 < str.size()) {
            switch (str[i + 1]) {
                case '"': result += '"'; ++i; break;
                case '\\': result += '\\'; ++i; break;
                case 'n': result += '\n'; ++i; break;
                case 'r': result += '\r'; ++i; break;
                case 't': result += '\t'; ++i; break;
                default: result += str[i]; break;
            }
        } else {
            result += str[i];
        }
    }

    return result;
}

// Raw value of the first "key": member. Strings come back without their
// quotes and still escaped; objects and arrays come back whole.
std::optional<std::string> ConfigManager::get_json_value(const std::string& json, std::string_view key) {
    std::string search_key = "\"";
    search_key += key;
    search_key += "\"";

    size_t colon_pos = std::string::npos;
    size_t key_pos = json.find(search_key);
    while (key_pos != std::string::npos) {
        // A string value that happens to equal the key is not followed by ':'
        size_t next = json.find_first_not_of(" \t\r\n", key_pos + search_key.size());
        if (next != std::string::npos && json[next] == ':') {
            colon_pos = next;
            break;
        }
        key_pos = json.find(search_key, key_pos + 1);
    }
    if (colon_pos == std::string::npos) {
        return std::nullopt;
    }

    size_t value_start = json.find_first_not_of(" \t\r\n", colon_pos + 1);
    if (value_start == std::string::npos) {
        return std::nullopt;
    }

    // Handle object/array values
    if (json[value_start] == '[' || json[value_start] == '{') {
        const char open = json[value_start];
        const char close = (open == '[') ? ']' : '}';
        int depth = 0;
        bool in_string = false;
        bool escape = false;

        for (size_t i = value_start; i < json.size(); ++i) {
            const char c = json[i];

            if (in_string) {
                if (escape) { escape = false; continue; }
                if (c == '\\') { escape = true; continue; }
                if (c == '"') in_string = false;
                continue;
            }

            if (c == '"') { in_string = true; continue; }
            if (c == open) { depth++; continue; }
            if (c == close) {
                depth--;
                if (depth == 0) {
                    return json.substr(value_start, (i - value_start) + 1);
                }
            }
        }
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        bool escape = false;
        for (size_t i = value_start + 1; i < json.size(); ++i) {
            if (escape) { escape = false; continue; }
            if (json[i] == '\\') { escape = true; continue; }
            if (json[i] == '"') {
                return json.substr(value_start + 1, i - (value_start + 1));
            }
        }
        return std::nullopt;
    }

    size_t value_end = json.find_first_of(",}]\n", value_start);
    if (value_end == std::string::npos) {
        value_end = json.size();
    }

    std::string value = json.substr(value_start, value_end - value_start);
    value.erase(0, value.find_first_not_of(" \t\r\n"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    return value;
}

std::optional<std::string> CommandStore::load() const {
    auto config = ConfigManager::load(config_path);
    if (!config || config->command.empty()) {
        return std::nullopt;
    }
    return config->command;
}

bool CommandStore::save(const std::string& command) const {
    Config config;
    try {
        config = ConfigManager::load(config_path).value_or(Config{});
    } catch (const ConfigError& e) {
        std::cerr << "Not overwriting config: " << e.what() << "\n";
        return false;
    }
    config.command = command;
    return ConfigManager::save(config_path, config);
}
