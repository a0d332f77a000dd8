#ifndef RELAY_PROTOCOL_HPP
#define RELAY_PROTOCOL_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "alert_ledger.hpp"
#include "detection.hpp"

/**
 * Remote command verbs. UNKNOWN keeps the raw name for the audit entry.
 */
enum class CommandAction {
    OPEN_DOOR,
    CLOSE_DOOR,
    START_STREAM,
    STOP_STREAM,
    UNKNOWN
};

const char *commandActionToString(CommandAction action);
CommandAction parseCommandAction(const std::string &name);

struct Command {
    CommandAction action = CommandAction::UNKNOWN;
    std::string action_name;  // as received
    std::string gate_id;      // empty = implicit (topic-scoped)
    double timestamp = 0.0;
};

/**
 * RelayProtocol - JSON payloads and topics exchanged with the cloud side
 *
 * Topics: <prefix>/<gate>/{commands,detection,status,ack,alert,stream,heartbeat}
 */
class RelayProtocol {
public:
    struct ParseResult {
        bool valid = false;
        std::string error;
    };

    static std::string topic(const std::string &prefix, const std::string &gate_id,
                             const std::string &leaf);

    /**
     * Extract the gate id from "<prefix>/<gate>/<leaf>". Empty if no match.
     */
    static std::string gateFromTopic(const std::string &prefix, const std::string &topic);

    static ParseResult parseCommand(const std::string &payload, Command &out);

    /**
     * Parse a detection report ({"objects":[..],"confidence":[..]} or
     * {"detections":[{"class":..,"confidence":..}]}).
     * Labels below min_confidence are dropped.
     */
    static ParseResult parseDetection(const std::string &payload, float min_confidence,
                                      DetectionSet &out);

    static std::string createCommandMessage(const std::string &action, const std::string &gate_id);
    static std::string createDetectionMessage(const std::string &gate_id, const DetectionSet &detections);
    static std::string createStatusMessage(const std::string &gate_id, const std::string &status);
    static std::string createAckMessage(const std::string &gate_id, const Command &command, bool applied);
    static std::string createAlertMessage(const std::string &gate_id, const Alert &alert);
    static std::string createStreamMessage(const std::string &gate_id, const std::string &stream_status);
    static std::string createHeartbeatMessage(const std::string &gate_id, uint32_t uptime_s,
                                              const std::string &gate_status);

    static nlohmann::json alertToJson(const Alert &alert);
    static nlohmann::json detectionToJson(const DetectionSet &detections);

    static double nowSeconds();
};

#endif // RELAY_PROTOCOL_HPP
