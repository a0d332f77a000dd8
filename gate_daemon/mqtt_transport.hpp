#ifndef MQTT_TRANSPORT_HPP
#define MQTT_TRANSPORT_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <mqtt/async_client.h>

#include "mqtt_config.hpp"
#include "relay_transport.hpp"

/**
 * MqttTransport - RelayTransport over Eclipse Paho MQTT C++
 *
 * Reconnects from tick() every reconnect_interval_ms while the broker is
 * unreachable and re-subscribes all filters on every (re)connect.
 */
class MqttTransport : public RelayTransport, public virtual mqtt::callback {
public:
    explicit MqttTransport(const MqttConfig &config);
    ~MqttTransport() override;

    /**
     * Begin connecting. Returns false if the attempt could not be issued;
     * tick() keeps retrying either way.
     */
    bool connect();
    void disconnect();

    /**
     * Called from the main loop.
     */
    void tick();

    bool publish(const std::string &topic, const std::string &payload, int timeout_ms) override;
    bool subscribe(const std::string &filter, MessageHandler handler) override;
    bool isConnected() const override;

    uint32_t getReconnectCount() const { return m_reconnects; }

private:
    // mqtt::callback
    void connected(const std::string &cause) override;
    void connection_lost(const std::string &cause) override;
    void message_arrived(mqtt::const_message_ptr msg) override;
    void delivery_complete(mqtt::delivery_token_ptr token) override;

    bool attemptConnect();
    static uint64_t now_ms();

    const MqttConfig m_config;
    mqtt::async_client m_client;
    mqtt::connect_options m_connopts;

    std::mutex m_connect_mutex;
    mqtt::token_ptr m_connect_tok;
    uint64_t m_last_attempt_ms = 0;
    bool m_enabled = false;
    uint32_t m_reconnects = 0;

    std::mutex m_sub_mutex;
    std::vector<std::pair<std::string, MessageHandler>> m_subscriptions;
};

#endif // MQTT_TRANSPORT_HPP
