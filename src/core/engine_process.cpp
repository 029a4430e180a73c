#include "core/engine_process.h"

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>
#include <spdlog/spdlog.h>

#include "core/engine_handle.h"

extern char** environ;

namespace hostgate {

namespace {

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

std::vector<std::string> EngineProcess::buildArgv(const std::string& command,
                                                  const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    std::istringstream iss(command);
    std::string word;
    while (iss >> word) {
        argv.push_back(word);
    }
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::unique_ptr<EngineProcess> EngineProcess::launch(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw EngineInitError("engine command is empty");
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid;
    int spawn_result = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (spawn_result != 0) {
        throw EngineInitError("failed to start engine '" + args[0] + "': " + std::strerror(spawn_result));
    }

    spdlog::info("Engine process started: pid={} command={}", pid, args[0]);
    return std::unique_ptr<EngineProcess>(new EngineProcess(pid));
}

EngineProcess::~EngineProcess() {
    terminate();
}

bool EngineProcess::isAlive() {
    if (pid_ <= 0 || reaped_) {
        return false;
    }
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r == pid_) {
        reaped_ = true;
        exit_status_ = decodeWaitStatus(status);
        spdlog::warn("Engine process {} exited with status {}", pid_, exit_status_);
    } else if (errno == ECHILD) {
        reaped_ = true;
    }
    return false;
}

void EngineProcess::terminate(std::chrono::seconds grace) {
    if (!isAlive()) {
        return;
    }
    spdlog::info("Stopping engine process {}", pid_);
    kill(pid_, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!isAlive()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::warn("Engine process {} did not stop within {}s; killing", pid_, grace.count());
    kill(pid_, SIGKILL);
    int status = 0;
    if (waitpid(pid_, &status, 0) == pid_) {
        exit_status_ = decodeWaitStatus(status);
    }
    reaped_ = true;
}

}  // namespace hostgate
