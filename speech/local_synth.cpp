#include "local_synth.hpp"
#include "logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace Speech {

ProcessSynthesizer::ProcessSynthesizer(std::vector<std::string> command)
    : command_(std::move(command)) {
    if (command_.empty()) command_.push_back("espeak-ng");
}

ProcessSynthesizer::~ProcessSynthesizer() {
    stop();
}

bool ProcessSynthesizer::speak(const std::string& text) {
    std::vector<std::string> args = command_;
    args.push_back(text);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopRequested_) return false;
        int rc = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
        if (rc != 0) {
            LOG_ERROR("LocalTTS", "Could not start " + command_[0] + ": " + std::strerror(rc));
            return false;
        }
        child_ = pid;
    }
    LOG_DEBUG("LocalTTS", "Speaking via " + command_[0] + " (pid " + std::to_string(pid) + ")");

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    {
        std::lock_guard<std::mutex> lock(mtx_);
        child_ = -1;
    }

    if (stopRequested_) return false;
    if (waited < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_ERROR("LocalTTS", command_[0] + " exited abnormally");
        return false;
    }
    return true;
}

void ProcessSynthesizer::stop() {
    std::lock_guard<std::mutex> lock(mtx_);
    stopRequested_ = true;
    if (child_ > 0) {
        kill(child_, SIGTERM);
        LOG_DEBUG("LocalTTS", "Stopped pid " + std::to_string(child_));
    }
}

bool ProcessSynthesizer::isSpeaking() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return child_ > 0;
}

} // namespace Speech
