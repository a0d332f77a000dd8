#ifndef TUNNEL_SUPERVISOR_HPP
#define TUNNEL_SUPERVISOR_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "alert_ledger.hpp"
#include "process_launcher.hpp"

enum class TunnelStatus {
    STOPPED,
    STARTING,
    HEALTHY,
    FAILED
};

const char *tunnelStatusToString(TunnelStatus status);

struct TunnelConfig {
    std::string host = "localhost";
    std::string user = "ec2-user";
    std::string key_path = "/etc/smartgate/tunnel_key";
    uint16_t ssh_port = 22;
    uint16_t remote_port = 2222;
    uint16_t local_port = 8554;
    uint32_t server_alive_interval_s = 30;

    uint32_t healthy_after_ms = 5000;
    uint32_t backoff_initial_ms = 1000;
    uint32_t backoff_max_ms = 60000;
    uint32_t terminate_grace_ms = 2000;
};

/**
 * TunnelSupervisor - Keeps the reverse SSH tunnel for the camera stream alive
 *
 * STOPPED -> STARTING -> HEALTHY. A child that exits while wanted raises
 * one critical alert, drops to STOPPED and gets exactly one restart after
 * the current backoff. Backoff doubles per failure and resets on HEALTHY.
 *
 * tick() runs from the main loop; start()/stop() may be called from any
 * thread.
 */
class TunnelSupervisor {
public:
    using StatusCallback = std::function<void(TunnelStatus status)>;
    using Clock = std::function<uint64_t()>;

    TunnelSupervisor(const TunnelConfig &config, ProcessLauncher &launcher, AlertLedger &ledger);
    ~TunnelSupervisor();

    TunnelSupervisor(const TunnelSupervisor &) = delete;
    TunnelSupervisor &operator=(const TunnelSupervisor &) = delete;

    void start();
    void stop();

    void tick();
    void tick(uint64_t now_ms);

    TunnelStatus status() const;
    bool isRunning() const;
    uint32_t getRestartCount() const;
    uint32_t getCurrentBackoffMs() const;

    void setStatusCallback(StatusCallback cb);

    /**
     * Replace the monotonic millisecond clock (tests).
     */
    void setClock(Clock clock);

    static std::vector<std::string> buildSshCommand(const TunnelConfig &config);

private:
    // Callers hold m_mutex; transitions are queued for notify()
    void launch(uint64_t now, std::vector<TunnelStatus> &changes);
    // Forget the child and return its pid for termination
    pid_t detachChild(std::vector<TunnelStatus> &changes);
    void setStatus(TunnelStatus status, std::vector<TunnelStatus> &changes);
    void scheduleRestart(uint64_t now);
    void notify(const std::vector<TunnelStatus> &changes);

    static uint64_t now_ms();

    const TunnelConfig m_config;
    ProcessLauncher &m_launcher;
    AlertLedger &m_ledger;

    mutable std::mutex m_mutex;
    TunnelStatus m_status = TunnelStatus::STOPPED;
    bool m_wanted = false;
    pid_t m_pid = -1;
    uint64_t m_started_ms = 0;
    bool m_restart_pending = false;
    uint64_t m_restart_at_ms = 0;
    uint32_t m_backoff_ms;
    uint32_t m_restart_count = 0;

    StatusCallback m_status_cb;
    Clock m_clock;
};

#endif // TUNNEL_SUPERVISOR_HPP
