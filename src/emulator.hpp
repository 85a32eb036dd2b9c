#ifndef EMULATOR_HPP
#define EMULATOR_HPP

#include <string>
#include <vector>

#include "config.hpp"

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs argv to completion and returns its exit status
    virtual int run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp/waitpid
class SystemProcessRunner : public ProcessRunner {
public:
    int run(const std::vector<std::string>& argv) override;
};

// Replaces every device placeholder in the saved command
std::string substitute_device(const std::string& command, const std::string& device_path);

std::vector<std::string> split_command(const std::string& command);

class EmulatorLauncher {
public:
    EmulatorLauncher(ProcessRunner& runner, const Settings& settings);

    std::vector<std::string> build_argv(const std::string& command, const std::string& device_path) const;
    int launch(const std::string& command, const std::string& device_path);

private:
    ProcessRunner& runner;
    bool use_sudo;
};

#endif // EMULATOR_HPP
