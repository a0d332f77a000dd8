/**
 * Relay Protocol Unit Tests
 */

#include <cstdio>
#include <nlohmann/json.hpp>
#include "../gate_daemon/relay_protocol.hpp"
#include "../gate_daemon/relay_transport.hpp"

using json = nlohmann::json;

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

void test_parse_command() {
    TEST("Parse command");

    Command cmd;
    auto result = RelayProtocol::parseCommand(R"({"action":"OPEN_DOOR","timestamp":1700000000.5})", cmd);

    bool ok = true;
    ok = ok && result.valid;
    ok = ok && (cmd.action == CommandAction::OPEN_DOOR);
    ok = ok && (cmd.action_name == "OPEN_DOOR");
    ok = ok && cmd.gate_id.empty();
    ok = ok && (cmd.timestamp > 1700000000.0 && cmd.timestamp < 1700000001.0);

    if (ok) {
        PASS();
    } else {
        FAIL("Command fields wrong");
    }
}

void test_parse_command_gate_forms() {
    TEST("Gate id as number or string");

    Command numeric;
    Command text;
    auto r1 = RelayProtocol::parseCommand(R"({"action":"close_door","gate":2})", numeric);
    auto r2 = RelayProtocol::parseCommand(R"({"action":"CLOSE_DOOR","gate":"2","timestamp":"12:00"})", text);

    bool ok = true;
    ok = ok && r1.valid && r2.valid;
    ok = ok && (numeric.gate_id == "2") && (text.gate_id == "2");
    ok = ok && (numeric.action == CommandAction::CLOSE_DOOR);
    ok = ok && (text.timestamp > 0.0);

    if (ok) {
        PASS();
    } else {
        FAIL("Gate id handling wrong");
    }
}

void test_parse_command_unknown() {
    TEST("Unknown action keeps its name");

    Command cmd;
    auto result = RelayProtocol::parseCommand(R"({"action":"SELF_DESTRUCT"})", cmd);

    bool ok = true;
    ok = ok && result.valid;
    ok = ok && (cmd.action == CommandAction::UNKNOWN);
    ok = ok && (cmd.action_name == "SELF_DESTRUCT");

    if (ok) {
        PASS();
    } else {
        FAIL("Unknown action mishandled");
    }
}

void test_parse_command_invalid() {
    TEST("Reject malformed commands");

    Command cmd;
    cmd.action_name = "untouched";

    bool ok = true;
    ok = ok && !RelayProtocol::parseCommand("{not json", cmd).valid;
    ok = ok && !RelayProtocol::parseCommand(R"({"gate":1})", cmd).valid;
    ok = ok && !RelayProtocol::parseCommand(R"({"action":5})", cmd).valid;
    ok = ok && !RelayProtocol::parseCommand("[1,2]", cmd).valid;
    ok = ok && (cmd.action_name == "untouched");

    if (ok) {
        PASS();
    } else {
        FAIL("Malformed command accepted");
    }
}

void test_parse_detection_objects() {
    TEST("Parse objects/confidence form");

    DetectionSet ds;
    auto result = RelayProtocol::parseDetection(
        R"({"objects":["dog","cat","dog"],"confidence":[0.9,0.3,0.95],"timestamp":42.0})", 0.5f, ds);

    bool ok = true;
    ok = ok && result.valid;
    ok = ok && (ds.size() == 1);
    ok = ok && ds.contains("dog") && !ds.contains("cat");
    ok = ok && (ds.labels["dog"] > 0.94f);
    ok = ok && (ds.timestamp == 42.0);

    if (ok) {
        PASS();
    } else {
        FAIL("Detection parse wrong");
    }
}

void test_parse_detection_list() {
    TEST("Parse detections list form");

    DetectionSet ds;
    auto result = RelayProtocol::parseDetection(
        R"({"detections":[{"class":"cat","confidence":0.7},{"class":"person"}]})", 0.5f, ds);

    bool ok = true;
    ok = ok && result.valid;
    ok = ok && ds.contains("cat") && ds.contains("person");

    DetectionSet empty;
    ok = ok && RelayProtocol::parseDetection(R"({"objects":[]})", 0.5f, empty).valid;
    ok = ok && empty.empty();

    if (ok) {
        PASS();
    } else {
        FAIL("Detections list wrong");
    }
}

void test_parse_detection_errors() {
    TEST("Engine error and malformed detections");

    DetectionSet ds;
    auto engine = RelayProtocol::parseDetection(R"({"error":"camera unplugged"})", 0.5f, ds);
    auto missing = RelayProtocol::parseDetection(R"({"frame":1})", 0.5f, ds);
    auto broken = RelayProtocol::parseDetection(R"({"objects":[1,2]})", 0.5f, ds);

    bool ok = true;
    ok = ok && !engine.valid && (engine.error.find("camera unplugged") != std::string::npos);
    ok = ok && !missing.valid && (missing.error == "Missing objects");
    ok = ok && !broken.valid;

    if (ok) {
        PASS();
    } else {
        FAIL("Bad detection accepted");
    }
}

void test_topics() {
    TEST("Topic layout");

    bool ok = true;
    ok = ok && (RelayProtocol::topic("smartgate", "1", "commands") == "smartgate/1/commands");
    ok = ok && (RelayProtocol::gateFromTopic("smartgate", "smartgate/12/status") == "12");
    ok = ok && RelayProtocol::gateFromTopic("smartgate", "other/12/status").empty();
    ok = ok && RelayProtocol::gateFromTopic("smartgate", "smartgate/12").empty();
    ok = ok && RelayProtocol::gateFromTopic("smartgate", "smartgate//status").empty();

    if (ok) {
        PASS();
    } else {
        FAIL("Topic handling wrong");
    }
}

void test_topic_matching() {
    TEST("Topic filter matching");

    bool ok = true;
    ok = ok && RelayTransport::topicMatches("smartgate/1/commands", "smartgate/1/commands");
    ok = ok && !RelayTransport::topicMatches("smartgate/1/commands", "smartgate/2/commands");
    ok = ok && RelayTransport::topicMatches("smartgate/+/status", "smartgate/9/status");
    ok = ok && !RelayTransport::topicMatches("smartgate/+/status", "smartgate/9/x/status");
    ok = ok && RelayTransport::topicMatches("smartgate/#", "smartgate/9/x/status");
    ok = ok && RelayTransport::topicMatches("#", "anything/at/all");
    ok = ok && !RelayTransport::topicMatches("smartgate/+", "smartgate");

    if (ok) {
        PASS();
    } else {
        FAIL("Filter matching wrong");
    }
}

void test_outbound_messages() {
    TEST("Outbound message formats");

    Command cmd;
    cmd.action = CommandAction::OPEN_DOOR;
    cmd.action_name = "open_door";

    json ack = json::parse(RelayProtocol::createAckMessage("3", cmd, false));
    json status = json::parse(RelayProtocol::createStatusMessage("3", "door_opened"));
    json hb = json::parse(RelayProtocol::createHeartbeatMessage("3", 120, "closed"));
    json command = json::parse(RelayProtocol::createCommandMessage("OPEN_DOOR", "4"));
    json stream = json::parse(RelayProtocol::createStreamMessage("3", "healthy"));

    bool ok = true;
    ok = ok && (ack["gate"] == "3") && (ack["action"] == "OPEN_DOOR") && (ack["result"] == "failed");
    ok = ok && (status["status"] == "door_opened") && status["timestamp"].is_number();
    ok = ok && (hb["gate_id"] == "3") && (hb["uptime_s"] == 120) && (hb["gate_status"] == "closed");
    ok = ok && (command["action"] == "OPEN_DOOR") && (command["gate"] == "4");
    ok = ok && (stream["stream"] == "healthy");

    if (ok) {
        PASS();
    } else {
        FAIL("Message format incorrect");
    }
}

void test_alert_and_detection_json() {
    TEST("Alert and detection JSON");

    Alert alert;
    alert.id = 9;
    alert.message = "door_opened (gate 1, remote)";
    alert.level = AlertLevel::WARNING;
    alert.timestamp_ms = 1700000000500ULL;

    DetectionSet ds;
    ds.add("dog", 0.75f);
    ds.timestamp = 0.0;

    json a = RelayProtocol::alertToJson(alert);
    json d = json::parse(RelayProtocol::createDetectionMessage("1", ds));

    bool ok = true;
    ok = ok && (a["id"] == 9) && (a["level"] == "warning");
    ok = ok && (a["timestamp"].get<double>() > 1700000000.4);
    ok = ok && (d["gate"] == "1") && (d["objects"][0] == "dog");
    ok = ok && (d["timestamp"].get<double>() > 0.0);

    if (ok) {
        PASS();
    } else {
        FAIL("JSON incorrect");
    }
}

int main() {
    printf("=== Relay Protocol Tests ===\n");

    test_parse_command();
    test_parse_command_gate_forms();
    test_parse_command_unknown();
    test_parse_command_invalid();
    test_parse_detection_objects();
    test_parse_detection_list();
    test_parse_detection_errors();
    test_topics();
    test_topic_matching();
    test_outbound_messages();
    test_alert_and_detection_json();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
