#include "app.hpp"
#include "device_scanner.hpp"
#include "emulator.hpp"
#include "input_source.hpp"
#include "log.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include "tui/live_monitor.hpp"

namespace {

std::unique_ptr<EventSource> open_event_source(const std::string& path) {
    auto source = std::make_unique<InputSource>();
    int rc = source->open_device(path);
    if (rc < 0) {
        std::cerr << "Failed to open " << path << ": " << strerror(-rc) << "\n";
        return nullptr;
    }
    return source;
}

int run_monitor(App& app, const CommandStore& store) {
    auto config = store.load_config();
    if (!config || (config->buttons.bindings.empty() && config->axes.bindings.empty())) {
        std::cout << "Config does not exist. Run with --setup first.\n";
        return 1;
    }

    std::string path = app.detect_device(config->settings, "Press any button on the controller to monitor.");

    InputSource device;
    int rc = device.open_device(path);
    if (rc < 0) {
        std::cerr << "Error: could not open " << path << ": " << strerror(-rc) << "\n";
        return 1;
    }

    LiveMonitor monitor(device, *config);
    monitor.run();
    return 0;
}

}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    ParseResult parsed = parse_options(args);

    if (!parsed.ok) {
        std::cerr << "Error: " << parsed.error << "\n\n";
        print_usage(std::cerr, argv[0]);
        return 2;
    }

    if (parsed.options.help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }

    const char* debug_env = getenv("XPADCFG_DEBUG");
    debug_enabled = parsed.options.debug || (debug_env && *debug_env && strcmp(debug_env, "0") != 0);

    CommandStore store(ConfigManager::get_config_path());
    EvdevBackend backend;
    SystemProcessRunner runner;
    App app(store, backend, open_event_source, runner, std::cout, std::cerr);

    try {
        switch (parsed.options.mode) {
            case Mode::Setup:
                return app.run_setup();
            case Mode::Emulate:
                return app.run_emulate();
            case Mode::Identify:
                return app.run_identify();
            case Mode::Monitor:
                return run_monitor(app, store);
            case Mode::None:
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 2;
}
