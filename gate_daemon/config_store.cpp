/**
 * ConfigStore Implementation
 */

#include "config_store.hpp"
#include "logger.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char *TAG = "Config";

ConfigStore::ConfigStore() {
}

bool ConfigStore::fail(const std::string &message) {
    m_last_error = message;
    return false;
}

RelayConfig ConfigStore::relayConfig() const {
    RelayConfig rc;
    rc.gate_id = gate_id;
    rc.topic_prefix = topic_prefix;
    rc.publish_timeout_ms = publish_timeout_ms;
    rc.max_pending = max_pending;
    return rc;
}

ConfigStore::LoadStatus ConfigStore::load(const std::string &path) {
    m_config_path = path;

    std::ifstream file(path);
    if (!file.is_open()) {
        m_last_error = "cannot open " + path;
        return LoadStatus::MISSING;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LoadStatus status = loadFromString(buffer.str());
    if (status == LoadStatus::LOADED) {
        LOG_INFO(TAG, "Loaded from %s (%zu rules)", path.c_str(), rules.size());
    }
    return status;
}

static bool parsePort(const json &section, const char *key, uint16_t &port) {
    if (!section.contains(key)) return true;
    int value = section.at(key).get<int>();
    if (value <= 0 || value > 65535) return false;
    port = (uint16_t)value;
    return true;
}

ConfigStore::LoadStatus ConfigStore::loadFromString(const std::string &text) {
    // Validate into a copy so a bad file leaves the current values intact
    ConfigStore next = *this;

    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            fail("top level is not an object");
            return LoadStatus::INVALID;
        }

        if (root.contains("gate_id")) {
            const json &id = root["gate_id"];
            next.gate_id = id.is_string() ? id.get<std::string>() : std::to_string(id.get<long long>());
            if (next.gate_id.empty() || next.gate_id.find('/') != std::string::npos ||
                next.gate_id.find_first_of("+#") != std::string::npos) {
                fail("gate_id must be a non-empty topic level");
                return LoadStatus::INVALID;
            }
        }

        if (root.contains("rules")) {
            next.rules.clear();
            size_t index = 0;
            for (const auto &entry : root.at("rules")) {
                Rule rule;
                for (const auto &label : entry.at("labels")) {
                    rule.trigger_labels.insert(label.get<std::string>());
                }
                if (!RuleEngine::isValid(rule)) {
                    fail("rule " + std::to_string(index) + " has no trigger labels");
                    return LoadStatus::INVALID;
                }
                std::string action = entry.at("action").get<std::string>();
                std::optional<GateAction> parsed = parseGateAction(action);
                if (!parsed) {
                    fail("rule " + std::to_string(index) + " has unknown action '" + action + "'");
                    return LoadStatus::INVALID;
                }
                rule.action = *parsed;
                next.rules.push_back(rule);
                index++;
            }
        }

        if (root.contains("mqtt")) {
            const json &m = root["mqtt"];
            next.mqtt.broker = m.value("broker", next.mqtt.broker);
            next.mqtt.client_id = m.value("client_id", next.mqtt.client_id);
            next.mqtt.keep_alive_s = m.value("keep_alive_s", next.mqtt.keep_alive_s);
            next.mqtt.qos = m.value("qos", next.mqtt.qos);
            next.mqtt.reconnect_interval_ms = m.value("reconnect_interval_ms", next.mqtt.reconnect_interval_ms);
            next.topic_prefix = m.value("topic_prefix", next.topic_prefix);
            next.publish_timeout_ms = m.value("publish_timeout_ms", next.publish_timeout_ms);
            next.heartbeat_interval_ms = m.value("heartbeat_interval_ms", next.heartbeat_interval_ms);
            next.max_pending = m.value("max_pending", next.max_pending);

            if (next.mqtt.qos < 0 || next.mqtt.qos > 2) {
                fail("mqtt.qos must be 0, 1 or 2");
                return LoadStatus::INVALID;
            }
            if (next.max_pending == 0 || next.publish_timeout_ms <= 0) {
                fail("mqtt.max_pending and mqtt.publish_timeout_ms must be positive");
                return LoadStatus::INVALID;
            }
        }

        if (root.contains("http")) {
            const json &h = root["http"];
            next.http_enabled = h.value("enabled", next.http_enabled);
            if (!parsePort(h, "port", next.http_port)) {
                fail("http.port out of range");
                return LoadStatus::INVALID;
            }
        }

        if (root.contains("detection")) {
            const json &d = root["detection"];
            next.detection_socket = d.value("socket_path", next.detection_socket);
            next.min_confidence = d.value("min_confidence", next.min_confidence);
            next.poll_timeout_ms = d.value("poll_timeout_ms", next.poll_timeout_ms);
            if (next.min_confidence < 0.0f || next.min_confidence > 1.0f) {
                fail("detection.min_confidence must be within [0, 1]");
                return LoadStatus::INVALID;
            }
        }

        if (root.contains("actuator")) {
            const json &a = root["actuator"];
            next.actuator_type = a.value("type", next.actuator_type);
            if (next.actuator_type != "gpio" && next.actuator_type != "simulated") {
                fail("actuator.type must be \"gpio\" or \"simulated\"");
                return LoadStatus::INVALID;
            }
            next.gpio.enable_pin = a.value("enable_pin", next.gpio.enable_pin);
            next.gpio.open_pin = a.value("open_pin", next.gpio.open_pin);
            next.gpio.close_pin = a.value("close_pin", next.gpio.close_pin);
            next.gpio.open_limit_pin = a.value("open_limit_pin", next.gpio.open_limit_pin);
            next.gpio.closed_limit_pin = a.value("closed_limit_pin", next.gpio.closed_limit_pin);
            next.gpio.limit_active_value = a.value("limit_active_value", next.gpio.limit_active_value);
            next.gpio.travel_timeout_ms = a.value("travel_timeout_ms", next.gpio.travel_timeout_ms);
        }

        if (root.contains("tunnel")) {
            const json &t = root["tunnel"];
            next.tunnel_enabled = t.value("enabled", next.tunnel_enabled);
            next.tunnel_autostart = t.value("autostart", next.tunnel_autostart);
            next.tunnel.host = t.value("host", next.tunnel.host);
            next.tunnel.user = t.value("user", next.tunnel.user);
            next.tunnel.key_path = t.value("key_path", next.tunnel.key_path);
            next.tunnel.server_alive_interval_s = t.value("server_alive_interval_s",
                                                          next.tunnel.server_alive_interval_s);
            next.tunnel.healthy_after_ms = t.value("healthy_after_ms", next.tunnel.healthy_after_ms);
            next.tunnel.backoff_initial_ms = t.value("backoff_initial_ms", next.tunnel.backoff_initial_ms);
            next.tunnel.backoff_max_ms = t.value("backoff_max_ms", next.tunnel.backoff_max_ms);
            if (!parsePort(t, "ssh_port", next.tunnel.ssh_port) ||
                !parsePort(t, "remote_port", next.tunnel.remote_port) ||
                !parsePort(t, "local_port", next.tunnel.local_port)) {
                fail("tunnel port out of range");
                return LoadStatus::INVALID;
            }
            if (next.tunnel.backoff_initial_ms == 0 ||
                next.tunnel.backoff_max_ms < next.tunnel.backoff_initial_ms) {
                fail("tunnel backoff must satisfy 0 < backoff_initial_ms <= backoff_max_ms");
                return LoadStatus::INVALID;
            }
        }

        if (root.contains("log")) {
            const json &l = root["log"];
            next.log_level = l.value("level", next.log_level);
            next.log_file = l.value("file", next.log_file);
        }
    } catch (const json::exception &e) {
        fail(std::string("JSON error: ") + e.what());
        return LoadStatus::INVALID;
    }

    std::string path = m_config_path;
    *this = next;
    m_config_path = path;
    m_last_error.clear();
    return LoadStatus::LOADED;
}
