/**
 * RelayClient Implementation
 */

#include "relay_client.hpp"
#include "logger.h"

#include <chrono>
#include <stdexcept>

static const char *TAG = "Relay";

static constexpr uint64_t FAILURE_WARN_INTERVAL_MS = 30000;

uint64_t RelayClient::now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

RelayClient::RelayClient(const RelayConfig &config, RelayTransport &transport,
                         GateController &gate, AlertLedger &ledger)
    : m_config(config), m_transport(transport), m_gate(gate), m_ledger(ledger) {}

RelayClient::~RelayClient() {
    stop();
}

bool RelayClient::start() {
    if (m_running.load()) {
        return true;
    }

    // The transport keeps subscriptions across stop(); register the handler once
    bool subscribed = m_subscribed;
    if (!subscribed) {
        std::string filter = RelayProtocol::topic(m_config.topic_prefix, m_config.gate_id, "commands");
        subscribed = m_transport.subscribe(filter,
            [this](const std::string &topic, const std::string &payload) {
                onCommandMessage(topic, payload);
            });
        if (!subscribed) {
            LOG_WARN(TAG, "Subscribe to %s failed; commands unavailable until it succeeds", filter.c_str());
        }
        m_subscribed = subscribed;
    }

    m_running.store(true);
    m_worker = std::thread(&RelayClient::workerLoop, this);

    LOG_INFO(TAG, "Relay started for gate %s (prefix %s)",
             m_config.gate_id.c_str(), m_config.topic_prefix.c_str());
    return subscribed;
}

void RelayClient::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    m_queue_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }

    size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        discarded = m_queue.size();
        m_queue.clear();
    }
    m_idle_cv.notify_all();

    LOG_INFO(TAG, "Relay stopped (published %u, failed %u, dropped %u, discarded %zu)",
             m_published.load(), m_failed.load(), m_dropped.load(), discarded);
}

void RelayClient::setTunnel(TunnelSupervisor *tunnel) {
    std::lock_guard<std::mutex> lock(m_tunnel_mutex);
    m_tunnel = tunnel;
}

// ============================================================================
// Outbound
// ============================================================================

void RelayClient::reportDetection(const DetectionSet &detections) {
    enqueue("detection", RelayProtocol::createDetectionMessage(m_config.gate_id, detections));
}

void RelayClient::reportCommandAck(const Command &command, bool applied) {
    enqueue("ack", RelayProtocol::createAckMessage(m_config.gate_id, command, applied));
}

void RelayClient::reportStatus(GateState state) {
    const char *status = (state == GateState::OPEN) ? "door_opened" : "door_closed";
    enqueue("status", RelayProtocol::createStatusMessage(m_config.gate_id, status));
}

void RelayClient::reportAlert(const Alert &alert) {
    enqueue("alert", RelayProtocol::createAlertMessage(m_config.gate_id, alert));
}

void RelayClient::reportStreamStatus(TunnelStatus status) {
    enqueue("stream", RelayProtocol::createStreamMessage(m_config.gate_id, tunnelStatusToString(status)));
}

void RelayClient::sendHeartbeat(uint32_t uptime_s) {
    enqueue("heartbeat", RelayProtocol::createHeartbeatMessage(
        m_config.gate_id, uptime_s, gateStateToString(m_gate.getState())));
}

bool RelayClient::sendCommand(const std::string &action, const std::string &gate_id) {
    std::string target = gate_id.empty() ? m_config.gate_id : gate_id;
    return enqueueTopic(RelayProtocol::topic(m_config.topic_prefix, target, "commands"),
                        RelayProtocol::createCommandMessage(action, target));
}

bool RelayClient::enqueue(const std::string &leaf, const std::string &payload) {
    return enqueueTopic(RelayProtocol::topic(m_config.topic_prefix, m_config.gate_id, leaf), payload);
}

bool RelayClient::enqueueTopic(const std::string &topic, const std::string &payload) {
    if (!m_running.load()) {
        LOG_DEBUG(TAG, "Not running, dropped %s", topic.c_str());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        while (m_queue.size() >= m_config.max_pending && !m_queue.empty()) {
            LOG_DEBUG(TAG, "Queue full, dropping %s", m_queue.front().topic.c_str());
            m_queue.pop_front();
            m_dropped++;
        }
        m_queue.push_back({topic, payload});
    }
    m_queue_cv.notify_one();
    return true;
}

void RelayClient::workerLoop() {
    while (true) {
        Outbound msg;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait(lock, [this] { return !m_running.load() || !m_queue.empty(); });
            if (!m_running.load()) {
                break;
            }
            msg = std::move(m_queue.front());
            m_queue.pop_front();
            m_in_flight = true;
        }

        bool ok = m_transport.publish(msg.topic, msg.payload, m_config.publish_timeout_ms);
        if (ok) {
            m_published++;
        } else {
            recordFailure(msg.topic);
        }

        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_in_flight = false;
        }
        m_idle_cv.notify_all();
    }
}

void RelayClient::recordFailure(const std::string &topic) {
    m_failed++;
    m_failures_since_warn++;
    LOG_DEBUG(TAG, "Publish to %s failed (connected=%d)", topic.c_str(), m_transport.isConnected() ? 1 : 0);

    uint64_t now = now_ms();
    if (now - m_last_warn_ms >= FAILURE_WARN_INTERVAL_MS) {
        LOG_WARN(TAG, "%u relay publish failure(s) in the last %llus",
                 m_failures_since_warn, (unsigned long long)(FAILURE_WARN_INTERVAL_MS / 1000));
        m_failures_since_warn = 0;
        m_last_warn_ms = now;
    }
}

bool RelayClient::waitIdle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    return m_idle_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                              [this] { return m_queue.empty() && !m_in_flight; });
}

size_t RelayClient::getPendingCount() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_queue.size();
}

// ============================================================================
// Inbound
// ============================================================================

void RelayClient::onCommandMessage(const std::string &topic, const std::string &payload) {
    Command command;
    RelayProtocol::ParseResult result = RelayProtocol::parseCommand(payload, command);
    if (!result.valid) {
        m_ledger.addAlert("Malformed command on " + topic + ": " + result.error, AlertLevel::WARNING);
        return;
    }
    receiveCommand(command);
}

void RelayClient::receiveCommand(const Command &command) {
    std::lock_guard<std::mutex> lock(m_inbound_mutex);

    if (!command.gate_id.empty() && command.gate_id != m_config.gate_id) {
        m_ledger.addAlert("Ignored command " + command.action_name + " for gate " + command.gate_id +
                          " (this is gate " + m_config.gate_id + ")",
                          AlertLevel::WARNING);
        return;
    }

    LOG_INFO(TAG, "Command received: %s", command.action_name.c_str());

    switch (command.action) {
        case CommandAction::OPEN_DOOR:
        case CommandAction::CLOSE_DOOR: {
            GateAction action = (command.action == CommandAction::OPEN_DOOR)
                                    ? GateAction::OPEN : GateAction::CLOSE;
            bool applied = false;
            try {
                applied = m_gate.applyAction(action, "remote") != GateController::Result::FAILED;
            } catch (const std::invalid_argument &e) {
                m_ledger.addAlert(std::string("Rejected remote command: ") + e.what(), AlertLevel::WARNING);
            }
            reportCommandAck(command, applied);
            break;
        }

        case CommandAction::START_STREAM:
        case CommandAction::STOP_STREAM: {
            TunnelSupervisor *tunnel = nullptr;
            {
                std::lock_guard<std::mutex> tlock(m_tunnel_mutex);
                tunnel = m_tunnel;
            }
            if (!tunnel) {
                m_ledger.addAlert("Stream command " + command.action_name + " ignored: tunnel disabled",
                                  AlertLevel::WARNING);
                reportCommandAck(command, false);
                break;
            }
            if (command.action == CommandAction::START_STREAM) {
                tunnel->start();
            } else {
                tunnel->stop();
            }
            reportCommandAck(command, true);
            break;
        }

        case CommandAction::UNKNOWN:
            m_ledger.addAlert("Unknown command: " + command.action_name, AlertLevel::WARNING);
            break;
    }
}
