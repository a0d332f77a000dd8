/**
 * GateDirectory Implementation
 */

#include "gate_directory.hpp"
#include "logger.h"
#include "relay_protocol.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char *TAG = "Gates";

uint64_t GateDirectory::wall_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

GateDirectory::GateDirectory(const std::string &topic_prefix, const std::string &local_gate_id,
                             AlertLedger &ledger)
    : m_prefix(topic_prefix), m_local_gate_id(local_gate_id), m_ledger(ledger) {}

bool GateDirectory::attach(RelayTransport &transport) {
    auto handler = [this](const std::string &topic, const std::string &payload) {
        onMessage(topic, payload);
    };

    bool ok = true;
    for (const char *leaf : {"heartbeat", "status", "detection"}) {
        std::string filter = m_prefix + "/+/" + leaf;
        if (!transport.subscribe(filter, handler)) {
            LOG_WARN(TAG, "Subscribe %s failed", filter.c_str());
            ok = false;
        }
    }
    return ok;
}

std::string GateDirectory::normalizeStatus(const std::string &status) {
    if (status == "door_opened" || status == "open") return "open";
    if (status == "door_closed" || status == "closed") return "closed";
    return "unknown";
}

GateInfo &GateDirectory::touch(const std::string &gate_id, uint64_t now_ms) {
    GateInfo &info = m_gates[gate_id];
    if (info.gate_id.empty()) {
        info.gate_id = gate_id;
        LOG_INFO(TAG, "Discovered gate %s", gate_id.c_str());
    } else if (!info.online) {
        LOG_INFO(TAG, "Gate %s back online", gate_id.c_str());
    }
    info.online = true;
    info.last_seen_ms = now_ms;
    return info;
}

void GateDirectory::onMessage(const std::string &topic, const std::string &payload) {
    onMessage(topic, payload, wall_ms());
}

void GateDirectory::onMessage(const std::string &topic, const std::string &payload, uint64_t now_ms) {
    std::string gate_id = RelayProtocol::gateFromTopic(m_prefix, topic);
    if (gate_id.empty()) {
        return;
    }
    std::string leaf = topic.substr(topic.rfind('/') + 1);

    json msg;
    try {
        msg = json::parse(payload);
    } catch (const json::exception &e) {
        LOG_WARN(TAG, "Non-JSON message on %s: %s", topic.c_str(), e.what());
        return;
    }
    if (!msg.is_object()) {
        LOG_WARN(TAG, "Unexpected payload on %s", topic.c_str());
        return;
    }

    const bool remote = (gate_id != m_local_gate_id);
    std::string alert;
    AlertLevel level = AlertLevel::INFO;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        GateInfo &info = touch(gate_id, now_ms);

        if (leaf == "heartbeat") {
            auto it = msg.find("gate_status");
            if (it != msg.end() && it->is_string()) {
                info.gate_status = normalizeStatus(it->get<std::string>());
            }
        } else if (leaf == "status") {
            std::string status = "unknown";
            auto it = msg.find("status");
            if (it != msg.end() && it->is_string()) {
                status = it->get<std::string>();
            }
            info.gate_status = normalizeStatus(status);
            alert = "Gate " + gate_id + " status: " + status;
        } else if (leaf == "detection") {
            auto it = msg.find("objects");
            if (it != msg.end() && it->is_array() && !it->empty()) {
                std::string objects;
                for (const auto &obj : *it) {
                    if (!obj.is_string()) continue;
                    if (!objects.empty()) objects += ", ";
                    objects += obj.get<std::string>();
                }
                if (!objects.empty()) {
                    alert = "Gate " + gate_id + ": Animal detected: " + objects;
                    level = AlertLevel::WARNING;
                }
            }
        }
    }

    // The local gate already audits its own events
    if (remote && !alert.empty()) {
        m_ledger.addAlert(alert, level);
    }
}

void GateDirectory::sweep() {
    sweep(wall_ms());
}

void GateDirectory::sweep(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &entry : m_gates) {
        GateInfo &info = entry.second;
        if (info.online && now_ms > info.last_seen_ms + OFFLINE_AFTER_MS) {
            info.online = false;
            LOG_WARN(TAG, "Gate %s offline (silent for %llus)", info.gate_id.c_str(),
                     (unsigned long long)((now_ms - info.last_seen_ms) / 1000));
        }
    }
}

std::vector<GateInfo> GateDirectory::gates() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<GateInfo> out;
    out.reserve(m_gates.size());
    for (const auto &entry : m_gates) {
        out.push_back(entry.second);
    }
    return out;
}

std::optional<GateInfo> GateDirectory::find(const std::string &gate_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_gates.find(gate_id);
    if (it == m_gates.end()) {
        return std::nullopt;
    }
    return it->second;
}
