#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "gpio_actuator.hpp"
#include "mqtt_config.hpp"
#include "relay_client.hpp"
#include "rule_engine.hpp"
#include "tunnel_supervisor.hpp"

/**
 * ConfigStore - Daemon configuration loaded from a JSON file
 *
 * Every field has a default; a missing file leaves them all in place.
 */
class ConfigStore {
public:
    static constexpr const char *DEFAULT_PATH = "/etc/smartgate/config.json";

    enum class LoadStatus {
        LOADED,
        MISSING,  // file not found, defaults kept
        INVALID   // parse or validation error, see lastError()
    };

    ConfigStore();

    LoadStatus load(const std::string &path);

    /**
     * Parse configuration text. Fields absent from the text keep their
     * current values.
     */
    LoadStatus loadFromString(const std::string &text);

    const std::string &lastError() const { return m_last_error; }
    const std::string &path() const { return m_config_path; }

    RelayConfig relayConfig() const;

    // Identity and rules
    std::string gate_id = "1";
    std::vector<Rule> rules;

    // Relay / MQTT
    MqttConfig mqtt;
    std::string topic_prefix = "smartgate";
    int publish_timeout_ms = 2000;
    uint32_t heartbeat_interval_ms = 10000;
    size_t max_pending = 64;

    // HTTP API
    bool http_enabled = true;
    uint16_t http_port = 5000;

    // Inference engine
    std::string detection_socket = "/tmp/smartgate_detect.sock";
    float min_confidence = 0.5f;
    int poll_timeout_ms = 200;

    // Actuator
    std::string actuator_type = "gpio";
    GpioActuatorConfig gpio;

    // Camera tunnel
    bool tunnel_enabled = false;
    bool tunnel_autostart = false;
    TunnelConfig tunnel;

    // Logging
    std::string log_level = "INFO";
    std::string log_file;

private:
    bool fail(const std::string &message);

    std::string m_config_path;
    std::string m_last_error;
};

#endif // CONFIG_STORE_HPP
