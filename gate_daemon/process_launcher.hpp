#ifndef PROCESS_LAUNCHER_HPP
#define PROCESS_LAUNCHER_HPP

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

/**
 * ProcessLauncher - Spawns and reaps supervised child processes
 */
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /**
     * Start argv[0] with the given arguments. Returns the pid, or -1.
     */
    virtual pid_t spawn(const std::vector<std::string> &argv) = 0;

    /**
     * Non-blocking liveness check. Reaps the child once it has exited;
     * exit_status receives the raw wait status when non-null.
     */
    virtual bool isAlive(pid_t pid, int *exit_status = nullptr) = 0;

    /**
     * SIGTERM, then SIGKILL if the child outlives grace_ms. Always reaps.
     */
    virtual void terminate(pid_t pid, int grace_ms) = 0;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    pid_t spawn(const std::vector<std::string> &argv) override;
    bool isAlive(pid_t pid, int *exit_status = nullptr) override;
    void terminate(pid_t pid, int grace_ms) override;
};

#endif // PROCESS_LAUNCHER_HPP
