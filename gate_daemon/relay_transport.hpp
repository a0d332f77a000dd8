#ifndef RELAY_TRANSPORT_HPP
#define RELAY_TRANSPORT_HPP

#include <functional>
#include <string>

/**
 * RelayTransport - Publish/subscribe link to the cloud broker
 *
 * Topic filters follow MQTT rules: '+' matches one level, '#' the rest.
 */
class RelayTransport {
public:
    using MessageHandler = std::function<void(const std::string &topic, const std::string &payload)>;

    virtual ~RelayTransport() = default;

    /**
     * Publish and wait at most timeout_ms for delivery.
     * Returns false on timeout, disconnect or broker error. Never throws.
     */
    virtual bool publish(const std::string &topic, const std::string &payload, int timeout_ms) = 0;

    /**
     * Register a handler; the subscription survives reconnects.
     * Handlers run on the transport's callback thread, one at a time.
     */
    virtual bool subscribe(const std::string &filter, MessageHandler handler) = 0;

    virtual bool isConnected() const = 0;

    static bool topicMatches(const std::string &filter, const std::string &topic);
};

#endif // RELAY_TRANSPORT_HPP
