#include "app.hpp"
#include "axismap_wizard.hpp"
#include "catalog.hpp"
#include "command_builder.hpp"
#include "event_reader.hpp"
#include "keymap_wizard.hpp"
#include "log.hpp"
#include <chrono>
#include <utility>

ParseResult parse_options(const std::vector<std::string>& args) {
    ParseResult result;
    int mode_count = 0;

    for (const auto& arg : args) {
        Mode mode = Mode::None;
        if (arg == "--setup") {
            mode = Mode::Setup;
        } else if (arg == "--emulate") {
            mode = Mode::Emulate;
        } else if (arg == "--identify") {
            mode = Mode::Identify;
        } else if (arg == "--monitor") {
            mode = Mode::Monitor;
        } else if (arg == "--debug" || arg == "-d") {
            result.options.debug = true;
            continue;
        } else if (arg == "--help" || arg == "-h") {
            result.options.help = true;
            continue;
        } else {
            result.error = "unknown argument: " + arg;
            return result;
        }

        result.options.mode = mode;
        mode_count++;
    }

    if (result.options.help) {
        result.ok = true;
        return result;
    }

    if (mode_count != 1) {
        result.error = "exactly one of --setup, --emulate, --identify or --monitor is required";
        return result;
    }

    result.ok = true;
    return result;
}

void print_usage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " (--setup | --emulate | --identify | --monitor) [-d]\n\n";
    out << "Modes:\n";
    out << "  --setup      Map a controller's buttons and axes and save the emulator command\n";
    out << "  --emulate    Run the saved emulator command on the controller you press\n";
    out << "  --identify   Print the device node of the controller you press\n";
    out << "  --monitor    Show the controller live through the saved mapping\n";
    out << "\nOptions:\n";
    out << "  -d, --debug  Print diagnostics to stderr\n";
    out << "  -h, --help   Show this help message\n";
    out << "\nConfig: " << ConfigManager::get_config_path() << " (override with XPADCFG_CONFIG)\n";
}

App::App(CommandStore& store, DeviceBackend& backend, DeviceOpener opener,
         ProcessRunner& runner, std::ostream& out, std::ostream& err)
    : store(store), backend(backend), opener(std::move(opener)), runner(runner), out(out), err(err) {
}

std::string App::detect_device(const Settings& settings, const std::string& prompt) {
    err << prompt << "\n";
    err.flush();

    DeviceScanner scanner(backend, std::chrono::milliseconds(settings.settle_ms));
    std::string path = scanner.detect_gamepad();
    DEBUG_LOG("Detected %s\n", path.c_str());
    return path;
}

void App::print_summary(const Config& config) {
    out << "\n=== Summary ===\n";
    if (!config.device_name.empty()) {
        out << "Controller: " << config.device_name << "\n";
    }

    out << "\n" << config.buttons.bindings.size() << " button bindings\n";
    for (const auto& binding : config.buttons.bindings) {
        out << "  " << binding.key_name << " -> " << button_label(binding.button) << "\n";
    }

    out << "\n" << config.axes.bindings.size() << " axis bindings\n";
    for (const auto& binding : config.axes.bindings) {
        out << "  " << binding.axis_name << " -> " << axis_label(binding.axis)
            << (binding.inverted ? " (inverted)" : "") << "\n";
    }

    out << "\nCommand: " << config.command << "\n";
}

int App::run_setup() {
    std::optional<Config> existing;
    try {
        existing = store.load_config();
    } catch (const ConfigError& e) {
        err << "Error: " << e.what() << "\n";
        err << "Fix or remove " << store.get_path() << " before running setup again.\n";
        return 1;
    }
    Config config = existing.value_or(Config{});

    std::string path = detect_device(config.settings, "Press any button on the controller you want to set up.");
    auto source = opener(path);
    if (!source) {
        err << "Error: could not open " << path << "\n";
        return 1;
    }
    out << "Using " << source->name() << " (" << path << ")\n";

    EventReader reader(*source);
    ButtonMapping buttons = collect_button_mapping(reader, out);
    AxisMapping axes = collect_axis_mapping(reader, buttons, out,
                                            std::chrono::milliseconds(config.settings.debounce_ms));

    config.version = CONFIG_VERSION;
    config.device_name = source->name();
    config.buttons = buttons;
    config.axes = axes;
    config.command = CommandBuilder(config.settings.emulator).build(buttons, axes);

    print_summary(config);

    if (!store.save_config(config)) {
        err << "Error: Failed to write config file " << store.get_path() << "\n";
        return 1;
    }
    out << "\nConfiguration written to " << store.get_path() << "\n";
    return 0;
}

int App::run_emulate() {
    std::optional<Config> config;
    try {
        config = store.load_config();
    } catch (const ConfigError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
    if (!config || config->command.empty()) {
        out << "Config does not exist. Run with --setup first.\n";
        return 1;
    }

    const std::string& command = config->command;
    Settings settings = config->settings;
    std::string path = detect_device(settings, "Press any button on the controller to emulate.");

    EmulatorLauncher launcher(runner, settings);
    int status = launcher.launch(command, path);
    if (status != 0) {
        err << settings.emulator << " exited with status " << status << "\n";
    }
    return status;
}

int App::run_identify() {
    std::optional<Config> config;
    try {
        config = store.load_config();
    } catch (const ConfigError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
    Settings settings = config.value_or(Config{}).settings;
    std::string path = detect_device(settings, "Press any button on the controller to identify.");
    out << path << "\n";
    return 0;
}
