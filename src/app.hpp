#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "device_scanner.hpp"
#include "emulator.hpp"
#include "event_source.hpp"

enum class Mode {
    None,
    Setup,
    Emulate,
    Identify,
    Monitor
};

struct Options {
    Mode mode = Mode::None;
    bool debug = false;
    bool help = false;
};

struct ParseResult {
    bool ok = false;
    Options options;
    std::string error;
};

// Exactly one mode flag is accepted; -h/--help wins over everything
ParseResult parse_options(const std::vector<std::string>& args);

void print_usage(std::ostream& out, const std::string& program);

class App {
public:
    // nullptr when the device could not be opened
    using DeviceOpener = std::function<std::unique_ptr<EventSource>(const std::string& path)>;

    App(CommandStore& store, DeviceBackend& backend, DeviceOpener opener,
        ProcessRunner& runner, std::ostream& out, std::ostream& err);

    int run_setup();
    int run_emulate();
    int run_identify();

    // Waits for the user to touch exactly one device
    std::string detect_device(const Settings& settings, const std::string& prompt);

private:
    CommandStore& store;
    DeviceBackend& backend;
    DeviceOpener opener;
    ProcessRunner& runner;
    std::ostream& out;
    std::ostream& err;

    void print_summary(const Config& config);
};
