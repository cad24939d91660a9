// filename: process.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/process.hpp"

#include "flowbridge/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace flowbridge {

ChildProcess::~ChildProcess() {
    kill();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept : pid_(other.pid_), status_(other.status_) {
    other.pid_ = -1;
    other.status_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        kill();
        pid_ = other.pid_;
        status_ = other.status_;
        other.pid_ = -1;
        other.status_.reset();
    }
    return *this;
}

ChildProcess ChildProcess::spawn(const std::string& program, const std::vector<std::string>& args,
                                 bool searchPath) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    const int rc = searchPath ? ::posix_spawnp(&pid, program.c_str(), nullptr, nullptr, argv.data(), environ)
                              : ::posix_spawn(&pid, program.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        throw LifecycleError("Failed to start " + program + ": " + std::strerror(rc));
    }
    return ChildProcess(pid);
}

bool ChildProcess::running() {
    if (pid_ <= 0 || status_) {
        return false;
    }
    int status = 0;
    pid_t rc = 0;
    do {
        rc = ::waitpid(pid_, &status, WNOHANG);
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) {
        return true;
    }
    // rc < 0 means the child is not ours to reap any more (ECHILD).
    status_ = rc == pid_ ? status : 0;
    return false;
}

bool ChildProcess::waitForExit(Millis timeout, Millis pollInterval) {
    const Deadline deadline(timeout);
    while (running()) {
        if (deadline.expired()) {
            return false;
        }
        std::this_thread::sleep_for(std::min(pollInterval, std::max(deadline.remaining(), Millis{1})));
    }
    return true;
}

void ChildProcess::kill() {
    if (!running()) {
        return;
    }
    ::kill(pid_, SIGKILL);
    int status = 0;
    pid_t rc = 0;
    do {
        rc = ::waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);
    status_ = rc == pid_ ? status : 0;
}

std::string ChildProcess::describeExit() const {
    if (!status_) {
        return "running";
    }
    if (WIFEXITED(*status_)) {
        return "exit code " + std::to_string(WEXITSTATUS(*status_));
    }
    if (WIFSIGNALED(*status_)) {
        return "signal " + std::to_string(WTERMSIG(*status_));
    }
    return "status " + std::to_string(*status_);
}

bool isExecutableFile(const std::string& path) {
    struct stat info {};
    return !path.empty() && ::stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

}  // namespace flowbridge
