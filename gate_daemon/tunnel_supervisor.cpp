/**
 * TunnelSupervisor Implementation
 */

#include "tunnel_supervisor.hpp"
#include "logger.h"

#include <algorithm>
#include <chrono>
#include <sys/wait.h>

static const char *TAG = "Tunnel";

const char *tunnelStatusToString(TunnelStatus status) {
    switch (status) {
        case TunnelStatus::STOPPED:  return "stopped";
        case TunnelStatus::STARTING: return "starting";
        case TunnelStatus::HEALTHY:  return "healthy";
        case TunnelStatus::FAILED:   return "failed";
    }
    return "unknown";
}

static std::string describeExit(int status) {
    if (status < 0) return "status unknown";
    if (WIFEXITED(status)) return "exit " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

uint64_t TunnelSupervisor::now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

TunnelSupervisor::TunnelSupervisor(const TunnelConfig &config, ProcessLauncher &launcher, AlertLedger &ledger)
    : m_config(config), m_launcher(launcher), m_ledger(ledger),
      m_backoff_ms(config.backoff_initial_ms), m_clock(&TunnelSupervisor::now_ms) {}

TunnelSupervisor::~TunnelSupervisor() {
    // Terminates the child only: no status callbacks, no alerts
    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<TunnelStatus> unused;
        pid = detachChild(unused);
    }
    if (pid > 0) {
        m_launcher.terminate(pid, (int)m_config.terminate_grace_ms);
    }
}

std::vector<std::string> TunnelSupervisor::buildSshCommand(const TunnelConfig &config) {
    return {
        "ssh", "-N",
        "-R", std::to_string(config.remote_port) + ":localhost:" + std::to_string(config.local_port),
        "-i", config.key_path,
        "-p", std::to_string(config.ssh_port),
        "-o", "ServerAliveInterval=" + std::to_string(config.server_alive_interval_s),
        "-o", "ServerAliveCountMax=3",
        "-o", "ExitOnForwardFailure=yes",
        "-o", "StrictHostKeyChecking=accept-new",
        config.user + "@" + config.host
    };
}

void TunnelSupervisor::start() {
    std::vector<TunnelStatus> changes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_wanted) {
            return;
        }
        m_wanted = true;
        m_backoff_ms = m_config.backoff_initial_ms;
        m_restart_pending = false;

        LOG_INFO(TAG, "Opening reverse tunnel %u:localhost:%u via %s@%s",
                 (unsigned)m_config.remote_port, (unsigned)m_config.local_port,
                 m_config.user.c_str(), m_config.host.c_str());
        launch(m_clock(), changes);
    }
    notify(changes);
}

void TunnelSupervisor::stop() {
    std::vector<TunnelStatus> changes;
    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_wanted && m_pid < 0) {
            return;
        }
        pid = detachChild(changes);
    }

    if (pid > 0) {
        m_launcher.terminate(pid, (int)m_config.terminate_grace_ms);
    }
    m_ledger.addAlert("Camera stream tunnel stopped", AlertLevel::INFO);
    notify(changes);
}

pid_t TunnelSupervisor::detachChild(std::vector<TunnelStatus> &changes) {
    m_wanted = false;
    m_restart_pending = false;
    pid_t pid = m_pid;
    m_pid = -1;
    setStatus(TunnelStatus::STOPPED, changes);
    return pid;
}

void TunnelSupervisor::tick() {
    tick(m_clock());
}

void TunnelSupervisor::tick(uint64_t now) {
    std::vector<TunnelStatus> changes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_wanted) {
            return;
        }

        if (m_pid > 0) {
            int exit_status = -1;
            if (m_launcher.isAlive(m_pid, &exit_status)) {
                if (m_status == TunnelStatus::STARTING &&
                    now - m_started_ms >= m_config.healthy_after_ms) {
                    setStatus(TunnelStatus::HEALTHY, changes);
                    m_backoff_ms = m_config.backoff_initial_ms;
                }
            } else {
                pid_t dead = m_pid;
                m_pid = -1;
                setStatus(TunnelStatus::STOPPED, changes);
                m_ledger.addAlert("Camera stream tunnel died (pid " + std::to_string(dead) + ", " +
                                  describeExit(exit_status) + "), restarting in " +
                                  std::to_string(m_backoff_ms) + " ms",
                                  AlertLevel::CRITICAL);
                scheduleRestart(now);
            }
        } else if (m_restart_pending && now >= m_restart_at_ms) {
            m_restart_pending = false;
            m_restart_count++;
            LOG_INFO(TAG, "Restart attempt %u", m_restart_count);
            launch(now, changes);
        }
    }
    notify(changes);
}

void TunnelSupervisor::launch(uint64_t now, std::vector<TunnelStatus> &changes) {
    pid_t pid = m_launcher.spawn(buildSshCommand(m_config));
    if (pid < 0) {
        setStatus(TunnelStatus::FAILED, changes);
        m_ledger.addAlert("Camera stream tunnel failed to start, retrying in " +
                          std::to_string(m_backoff_ms) + " ms",
                          AlertLevel::CRITICAL);
        scheduleRestart(now);
        return;
    }

    m_pid = pid;
    m_started_ms = now;
    setStatus(TunnelStatus::STARTING, changes);
}

void TunnelSupervisor::scheduleRestart(uint64_t now) {
    m_restart_pending = true;
    m_restart_at_ms = now + m_backoff_ms;
    m_backoff_ms = std::min(m_backoff_ms * 2, m_config.backoff_max_ms);
}

void TunnelSupervisor::setStatus(TunnelStatus status, std::vector<TunnelStatus> &changes) {
    if (m_status == status) {
        return;
    }
    LOG_INFO(TAG, "%s -> %s", tunnelStatusToString(m_status), tunnelStatusToString(status));
    m_status = status;
    changes.push_back(status);
}

void TunnelSupervisor::notify(const std::vector<TunnelStatus> &changes) {
    StatusCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cb = m_status_cb;
    }
    if (!cb) return;
    for (TunnelStatus status : changes) {
        cb(status);
    }
}

TunnelStatus TunnelSupervisor::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

bool TunnelSupervisor::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pid > 0;
}

uint32_t TunnelSupervisor::getRestartCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_restart_count;
}

uint32_t TunnelSupervisor::getCurrentBackoffMs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_backoff_ms;
}

void TunnelSupervisor::setStatusCallback(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status_cb = std::move(cb);
}

void TunnelSupervisor::setClock(Clock clock) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_clock = std::move(clock);
}
