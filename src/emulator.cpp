#include "emulator.hpp"
#include "command_builder.hpp"
#include "log.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <sstream>
#include <utility>

int SystemProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return -1;
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        perror("fork failed");
        return -1;
    }

    if (pid == 0) {
        execvp(args[0], args.data());
        perror(args[0]);
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            perror("waitpid failed");
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string substitute_device(const std::string& command, const std::string& device_path) {
    const std::string placeholder = DEVICE_PLACEHOLDER;
    std::string result = command;

    size_t pos = result.find(placeholder);
    while (pos != std::string::npos) {
        result.replace(pos, placeholder.size(), device_path);
        pos = result.find(placeholder, pos + device_path.size());
    }
    return result;
}

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> argv;
    std::istringstream iss(command);
    std::string token;
    while (iss >> token) {
        argv.push_back(token);
    }
    return argv;
}

EmulatorLauncher::EmulatorLauncher(ProcessRunner& runner, const Settings& settings)
    : runner(runner), use_sudo(settings.use_sudo && geteuid() != 0) {
}

std::vector<std::string> EmulatorLauncher::build_argv(const std::string& command,
                                                      const std::string& device_path) const {
    std::vector<std::string> argv;
    if (use_sudo) {
        argv.push_back("sudo");
    }
    for (auto& token : split_command(substitute_device(command, device_path))) {
        argv.push_back(std::move(token));
    }
    return argv;
}

int EmulatorLauncher::launch(const std::string& command, const std::string& device_path) {
    auto argv = build_argv(command, device_path);

    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) joined += " ";
        joined += arg;
    }
    DEBUG_LOG("Running: %s\n", joined.c_str());

    return runner.run(argv);
}
