#ifndef MQTT_CONFIG_HPP
#define MQTT_CONFIG_HPP

#include <cstdint>
#include <string>

struct MqttConfig {
    std::string broker = "tcp://localhost:1883";
    std::string client_id = "smartgate-1";
    int keep_alive_s = 20;
    int qos = 1;
    uint32_t reconnect_interval_ms = 5000;
};

#endif // MQTT_CONFIG_HPP
