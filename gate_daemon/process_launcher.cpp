/**
 * PosixProcessLauncher Implementation
 */

#include "process_launcher.hpp"
#include "logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

static const char *TAG = "Process";

pid_t PosixProcessLauncher::spawn(const std::vector<std::string> &argv) {
    if (argv.empty()) {
        LOG_ERROR(TAG, "Empty command line");
        return -1;
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        LOG_ERROR(TAG, "fork failed: %s", strerror(errno));
        return -1;
    }

    if (pid == 0) {
        // Child: detach stdin, keep stderr for ssh diagnostics
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    LOG_INFO(TAG, "Started %s (pid %d)", argv[0].c_str(), (int)pid);
    return pid;
}

bool PosixProcessLauncher::isAlive(pid_t pid, int *exit_status) {
    if (pid <= 0) return false;

    int status = 0;
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == 0) {
        return true;
    }
    if (ret < 0) {
        // ECHILD: already reaped elsewhere
        LOG_DEBUG(TAG, "waitpid(%d): %s", (int)pid, strerror(errno));
        if (exit_status) *exit_status = -1;
        return false;
    }

    if (exit_status) *exit_status = status;
    return false;
}

void PosixProcessLauncher::terminate(pid_t pid, int grace_ms) {
    if (pid <= 0) return;

    if (kill(pid, SIGTERM) < 0 && errno == ESRCH) {
        waitpid(pid, nullptr, WNOHANG);
        return;
    }

    for (int waited = 0; waited < grace_ms; waited += 50) {
        if (!isAlive(pid)) {
            return;
        }
        usleep(50 * 1000);
    }

    LOG_WARN(TAG, "pid %d ignored SIGTERM, sending SIGKILL", (int)pid);
    if (kill(pid, SIGKILL) < 0) {
        LOG_DEBUG(TAG, "kill(%d): %s", (int)pid, strerror(errno));
    }
    if (waitpid(pid, nullptr, 0) < 0) {
        LOG_DEBUG(TAG, "waitpid(%d) after SIGKILL: %s", (int)pid, strerror(errno));
    }
}
