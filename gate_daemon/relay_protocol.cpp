/**
 * RelayProtocol Implementation
 */

#include "relay_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

using json = nlohmann::json;

// Remote senders mix epoch numbers and formatted strings; only numbers are kept
static double timestampOf(const json &root) {
    auto it = root.find("timestamp");
    if (it != root.end() && it->is_number()) {
        return it->get<double>();
    }
    return RelayProtocol::nowSeconds();
}

static std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

const char *commandActionToString(CommandAction action) {
    switch (action) {
        case CommandAction::OPEN_DOOR:    return "OPEN_DOOR";
        case CommandAction::CLOSE_DOOR:   return "CLOSE_DOOR";
        case CommandAction::START_STREAM: return "START_STREAM";
        case CommandAction::STOP_STREAM:  return "STOP_STREAM";
        case CommandAction::UNKNOWN:      return "UNKNOWN";
    }
    return "UNKNOWN";
}

CommandAction parseCommandAction(const std::string &name) {
    std::string upper = toUpper(name);
    if (upper == "OPEN_DOOR")    return CommandAction::OPEN_DOOR;
    if (upper == "CLOSE_DOOR")   return CommandAction::CLOSE_DOOR;
    if (upper == "START_STREAM") return CommandAction::START_STREAM;
    if (upper == "STOP_STREAM")  return CommandAction::STOP_STREAM;
    return CommandAction::UNKNOWN;
}

double RelayProtocol::nowSeconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               now.time_since_epoch()).count() / 1000.0;
}

std::string RelayProtocol::topic(const std::string &prefix, const std::string &gate_id,
                                 const std::string &leaf) {
    return prefix + "/" + gate_id + "/" + leaf;
}

std::string RelayProtocol::gateFromTopic(const std::string &prefix, const std::string &topic) {
    std::string head = prefix + "/";
    if (topic.compare(0, head.size(), head) != 0) {
        return "";
    }
    size_t start = head.size();
    size_t end = topic.find('/', start);
    if (end == std::string::npos || end == start) {
        return "";
    }
    return topic.substr(start, end - start);
}

RelayProtocol::ParseResult RelayProtocol::parseCommand(const std::string &payload, Command &out) {
    ParseResult result;

    try {
        json root = json::parse(payload);
        if (!root.is_object()) {
            result.error = "Command is not an object";
            return result;
        }

        auto it = root.find("action");
        if (it == root.end() || !it->is_string()) {
            result.error = "Missing action";
            return result;
        }

        Command cmd;
        cmd.action_name = it->get<std::string>();
        cmd.action = parseCommandAction(cmd.action_name);

        // Dashboard sends numeric gate ids, scripts send strings
        if (root.contains("gate")) {
            const json &gate = root["gate"];
            if (gate.is_string()) {
                cmd.gate_id = gate.get<std::string>();
            } else if (gate.is_number_integer()) {
                cmd.gate_id = std::to_string(gate.get<long long>());
            }
        }

        cmd.timestamp = timestampOf(root);

        out = cmd;
        result.valid = true;
    } catch (const json::exception &e) {
        result.error = std::string("Invalid JSON: ") + e.what();
    }

    return result;
}

RelayProtocol::ParseResult RelayProtocol::parseDetection(const std::string &payload, float min_confidence,
                                                         DetectionSet &out) {
    ParseResult result;

    try {
        json root = json::parse(payload);
        if (!root.is_object()) {
            result.error = "Detection is not an object";
            return result;
        }

        if (root.contains("error")) {
            result.error = "Engine error: " + root["error"].dump();
            return result;
        }

        DetectionSet ds;
        ds.timestamp = timestampOf(root);

        if (root.contains("detections")) {
            for (const auto &det : root.at("detections")) {
                std::string label = det.at("class").get<std::string>();
                float conf = det.value("confidence", 1.0f);
                if (conf >= min_confidence) {
                    ds.add(label, conf);
                }
            }
        } else if (root.contains("objects")) {
            const json &objects = root.at("objects");
            json confidence = root.value("confidence", json::array());
            for (size_t i = 0; i < objects.size(); i++) {
                float conf = i < confidence.size() ? confidence[i].get<float>() : 1.0f;
                if (conf >= min_confidence) {
                    ds.add(objects[i].get<std::string>(), conf);
                }
            }
        } else {
            result.error = "Missing objects";
            return result;
        }

        out = ds;
        result.valid = true;
    } catch (const json::exception &e) {
        result.error = std::string("Invalid JSON: ") + e.what();
    }

    return result;
}

json RelayProtocol::detectionToJson(const DetectionSet &detections) {
    json objects = json::array();
    json confidence = json::array();
    for (const auto &[label, conf] : detections.labels) {
        objects.push_back(label);
        confidence.push_back(conf);
    }
    return {
        {"objects", objects},
        {"confidence", confidence},
        {"timestamp", detections.timestamp}
    };
}

json RelayProtocol::alertToJson(const Alert &alert) {
    return {
        {"id", alert.id},
        {"message", alert.message},
        {"level", alertLevelToString(alert.level)},
        {"timestamp", alert.timestamp_ms / 1000.0}
    };
}

std::string RelayProtocol::createCommandMessage(const std::string &action, const std::string &gate_id) {
    json msg = {
        {"action", action},
        {"timestamp", nowSeconds()}
    };
    if (!gate_id.empty()) {
        msg["gate"] = gate_id;
    }
    return msg.dump();
}

std::string RelayProtocol::createDetectionMessage(const std::string &gate_id, const DetectionSet &detections) {
    json msg = detectionToJson(detections);
    msg["gate"] = gate_id;
    if (detections.timestamp <= 0.0) {
        msg["timestamp"] = nowSeconds();
    }
    return msg.dump();
}

std::string RelayProtocol::createStatusMessage(const std::string &gate_id, const std::string &status) {
    json msg = {
        {"gate", gate_id},
        {"status", status},
        {"timestamp", nowSeconds()}
    };
    return msg.dump();
}

std::string RelayProtocol::createAckMessage(const std::string &gate_id, const Command &command, bool applied) {
    json msg = {
        {"gate", gate_id},
        {"action", commandActionToString(command.action)},
        {"result", applied ? "applied" : "failed"},
        {"timestamp", nowSeconds()}
    };
    return msg.dump();
}

std::string RelayProtocol::createAlertMessage(const std::string &gate_id, const Alert &alert) {
    json msg = alertToJson(alert);
    msg["gate"] = gate_id;
    return msg.dump();
}

std::string RelayProtocol::createStreamMessage(const std::string &gate_id, const std::string &stream_status) {
    json msg = {
        {"gate", gate_id},
        {"stream", stream_status},
        {"timestamp", nowSeconds()}
    };
    return msg.dump();
}

std::string RelayProtocol::createHeartbeatMessage(const std::string &gate_id, uint32_t uptime_s,
                                                  const std::string &gate_status) {
    json msg = {
        {"gate_id", gate_id},
        {"timestamp", nowSeconds()},
        {"uptime_s", uptime_s},
        {"gate_status", gate_status}
    };
    return msg.dump();
}
