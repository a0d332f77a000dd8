/**
 * MqttTransport Implementation
 */

#include "mqtt_transport.hpp"
#include "logger.h"

#include <chrono>

static const char *TAG = "MQTT";

uint64_t MqttTransport::now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

MqttTransport::MqttTransport(const MqttConfig &config)
    : m_config(config),
      m_client(config.broker, config.client_id) {
    m_connopts = mqtt::connect_options_builder()
                     .keep_alive_interval(std::chrono::seconds(config.keep_alive_s))
                     .clean_session(true)
                     .finalize();
    m_client.set_callback(*this);
}

MqttTransport::~MqttTransport() {
    disconnect();
}

bool MqttTransport::connect() {
    std::lock_guard<std::mutex> lock(m_connect_mutex);
    m_enabled = true;
    return attemptConnect();
}

bool MqttTransport::attemptConnect() {
    m_last_attempt_ms = now_ms();
    try {
        LOG_INFO(TAG, "Connecting to %s as %s", m_config.broker.c_str(), m_config.client_id.c_str());
        m_connect_tok = m_client.connect(m_connopts);
        return true;
    } catch (const mqtt::exception &e) {
        LOG_WARN(TAG, "Connect to %s failed: %s", m_config.broker.c_str(), e.what());
        m_connect_tok.reset();
        return false;
    }
}

void MqttTransport::disconnect() {
    {
        std::lock_guard<std::mutex> lock(m_connect_mutex);
        if (!m_enabled) return;
        m_enabled = false;
    }

    try {
        if (m_client.is_connected()) {
            m_client.disconnect()->wait_for(std::chrono::milliseconds(1000));
        }
    } catch (const mqtt::exception &e) {
        LOG_WARN(TAG, "Disconnect failed: %s", e.what());
    }
    LOG_INFO(TAG, "Disconnected");
}

void MqttTransport::tick() {
    std::lock_guard<std::mutex> lock(m_connect_mutex);
    if (!m_enabled || m_client.is_connected()) {
        return;
    }
    // Previous attempt still in progress
    if (m_connect_tok && !m_connect_tok->is_complete()) {
        return;
    }
    if (now_ms() - m_last_attempt_ms < m_config.reconnect_interval_ms) {
        return;
    }
    m_reconnects++;
    attemptConnect();
}

bool MqttTransport::publish(const std::string &topic, const std::string &payload, int timeout_ms) {
    if (!m_client.is_connected()) {
        return false;
    }
    try {
        auto msg = mqtt::make_message(topic, payload, m_config.qos, false);
        return m_client.publish(msg)->wait_for(std::chrono::milliseconds(timeout_ms));
    } catch (const mqtt::exception &e) {
        LOG_DEBUG(TAG, "Publish to %s failed: %s", topic.c_str(), e.what());
        return false;
    }
}

bool MqttTransport::subscribe(const std::string &filter, MessageHandler handler) {
    {
        std::lock_guard<std::mutex> lock(m_sub_mutex);
        m_subscriptions.emplace_back(filter, std::move(handler));
    }

    // Not connected yet: connected() subscribes later
    if (!m_client.is_connected()) {
        return true;
    }
    try {
        return m_client.subscribe(filter, m_config.qos)->wait_for(std::chrono::milliseconds(2000));
    } catch (const mqtt::exception &e) {
        LOG_WARN(TAG, "Subscribe %s failed: %s", filter.c_str(), e.what());
        return false;
    }
}

bool MqttTransport::isConnected() const {
    return m_client.is_connected();
}

void MqttTransport::connected(const std::string &cause) {
    (void)cause;
    LOG_INFO(TAG, "Connected to %s", m_config.broker.c_str());

    std::vector<std::string> filters;
    {
        std::lock_guard<std::mutex> lock(m_sub_mutex);
        for (const auto &sub : m_subscriptions) {
            filters.push_back(sub.first);
        }
    }

    // No waiting here: tokens complete on this same callback thread
    for (const auto &filter : filters) {
        try {
            m_client.subscribe(filter, m_config.qos);
            LOG_DEBUG(TAG, "Subscribed %s", filter.c_str());
        } catch (const mqtt::exception &e) {
            LOG_WARN(TAG, "Subscribe %s failed: %s", filter.c_str(), e.what());
        }
    }
}

void MqttTransport::connection_lost(const std::string &cause) {
    LOG_WARN(TAG, "Connection lost%s%s", cause.empty() ? "" : ": ", cause.c_str());
}

void MqttTransport::message_arrived(mqtt::const_message_ptr msg) {
    const std::string &topic = msg->get_topic();
    std::string payload = msg->to_string();

    std::vector<MessageHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_sub_mutex);
        for (const auto &sub : m_subscriptions) {
            if (topicMatches(sub.first, topic)) {
                handlers.push_back(sub.second);
            }
        }
    }

    for (auto &handler : handlers) {
        try {
            handler(topic, payload);
        } catch (const std::exception &e) {
            LOG_ERROR(TAG, "Handler for %s threw: %s", topic.c_str(), e.what());
        }
    }
}

void MqttTransport::delivery_complete(mqtt::delivery_token_ptr token) {
    (void)token;
}
