#ifndef RELAY_CLIENT_HPP
#define RELAY_CLIENT_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "alert_ledger.hpp"
#include "detection.hpp"
#include "gate_controller.hpp"
#include "relay_protocol.hpp"
#include "relay_transport.hpp"
#include "tunnel_supervisor.hpp"

struct RelayConfig {
    std::string gate_id = "1";
    std::string topic_prefix = "smartgate";
    int publish_timeout_ms = 2000;
    size_t max_pending = 64;
};

/**
 * RelayClient - Best-effort bridge between the gate and the cloud dashboard
 *
 * Outbound reports are queued and published by a worker thread, each
 * bounded by publish_timeout_ms. Callers never wait on the network; when
 * the queue is full the oldest message is dropped. Delivery failures are
 * logged only, never raised or turned into alerts.
 *
 * Inbound commands are applied one at a time in receipt order.
 */
class RelayClient {
public:
    RelayClient(const RelayConfig &config, RelayTransport &transport,
                GateController &gate, AlertLedger &ledger);
    ~RelayClient();

    RelayClient(const RelayClient &) = delete;
    RelayClient &operator=(const RelayClient &) = delete;

    /**
     * Subscribe to this gate's command topic and start the worker.
     * A failed subscription is logged; the worker still starts.
     */
    bool start();

    /**
     * Stop the worker. Messages still queued are discarded.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * Stream commands are refused while no tunnel is attached.
     */
    void setTunnel(TunnelSupervisor *tunnel);

    // Outbound (fire-and-forget)
    void reportDetection(const DetectionSet &detections);
    void reportCommandAck(const Command &command, bool applied);
    void reportStatus(GateState state);
    void reportAlert(const Alert &alert);
    void reportStreamStatus(TunnelStatus status);
    void sendHeartbeat(uint32_t uptime_s);

    /**
     * Queue a command for a (possibly remote) gate's command topic.
     * Returns false if the relay is not running.
     */
    bool sendCommand(const std::string &action, const std::string &gate_id);

    // Inbound
    void receiveCommand(const Command &command);
    void onCommandMessage(const std::string &topic, const std::string &payload);

    /**
     * Wait until the queue is drained and no publish is in flight.
     */
    bool waitIdle(int timeout_ms);

    uint32_t getPublishedCount() const { return m_published.load(); }
    uint32_t getFailedCount() const { return m_failed.load(); }
    uint32_t getDroppedCount() const { return m_dropped.load(); }
    size_t getPendingCount() const;

    const RelayConfig &config() const { return m_config; }

private:
    struct Outbound {
        std::string topic;
        std::string payload;
    };

    bool enqueue(const std::string &leaf, const std::string &payload);
    bool enqueueTopic(const std::string &topic, const std::string &payload);
    void workerLoop();
    void recordFailure(const std::string &topic);

    static uint64_t now_ms();

    const RelayConfig m_config;
    RelayTransport &m_transport;
    GateController &m_gate;
    AlertLedger &m_ledger;

    std::mutex m_tunnel_mutex;
    TunnelSupervisor *m_tunnel = nullptr;

    std::mutex m_inbound_mutex;

    mutable std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::condition_variable m_idle_cv;
    std::deque<Outbound> m_queue;
    bool m_in_flight = false;

    std::atomic<bool> m_running{false};
    bool m_subscribed = false;
    std::thread m_worker;

    std::atomic<uint32_t> m_published{0};
    std::atomic<uint32_t> m_failed{0};
    std::atomic<uint32_t> m_dropped{0};

    // Rate-limited WARN for persistent relay failures
    uint64_t m_last_warn_ms = 0;
    uint32_t m_failures_since_warn = 0;
};

#endif // RELAY_CLIENT_HPP
