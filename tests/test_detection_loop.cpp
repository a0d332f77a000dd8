/**
 * Detection Loop Unit Tests
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <thread>
#include <nlohmann/json.hpp>
#include "../gate_daemon/detection_loop.hpp"
#include "../gate_daemon/logger.h"
#include "mocks/mock_actuator.hpp"
#include "mocks/mock_detection_source.hpp"
#include "mocks/mock_transport.hpp"

using json = nlohmann::json;

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

static std::vector<Rule> dogOpenCatClose() {
    Rule dog;
    dog.trigger_labels = {"dog"};
    dog.action = GateAction::OPEN;
    Rule cat;
    cat.trigger_labels = {"cat"};
    cat.action = GateAction::CLOSE;
    return {dog, cat};
}

/**
 * Full pipeline for gate "1" with mocks at the edges.
 */
struct Pipeline {
    MockDetectionSource source;
    MockActuator actuator;
    MockTransport transport;
    AlertLedger ledger;
    Telemetry telemetry;
    RuleEngine rules;
    GateController gate;
    RelayClient relay;
    DetectionLoop loop;

    explicit Pipeline(RelayConfig cfg = RelayConfig())
        : rules(dogOpenCatClose()),
          gate("1", actuator, ledger),
          relay(cfg, transport, gate, ledger),
          loop(source, rules, gate, relay, ledger, telemetry) {
        relay.start();
    }

    ~Pipeline() {
        relay.stop();
    }

    size_t count(AlertLevel level) const {
        size_t n = 0;
        for (const Alert &alert : ledger.listAlerts()) {
            if (alert.level == level) n++;
        }
        return n;
    }
};

void test_dog_opens_gate() {
    TEST("Detection {dog} opens the gate");

    Pipeline p;
    p.source.pushFrame({"dog"});

    auto result = p.loop.runOnce();
    auto alerts = p.ledger.listAlerts();

    bool ok = true;
    ok = ok && (result == DetectionLoop::CycleResult::PROCESSED);
    ok = ok && (p.gate.getState() == GateState::OPEN);
    ok = ok && (alerts.size() == 1);
    ok = ok && (alerts[0].level == AlertLevel::INFO);
    ok = ok && (alerts[0].message.find("door_opened") != std::string::npos);
    ok = ok && (alerts[0].message.find("dog") != std::string::npos);
    ok = ok && (p.telemetry.getActionCount() == 1);

    if (ok) {
        PASS();
    } else {
        FAIL("Gate not opened");
    }
}

void test_dog_and_cat_closes_gate() {
    TEST("Detection {dog, cat} closes the gate");

    Pipeline p;
    p.source.pushFrame({"dog"});
    p.source.pushFrame({"dog", "cat"});

    p.loop.runOnce();
    size_t before = p.ledger.size();
    p.loop.runOnce();
    auto alerts = p.ledger.listAlerts();

    bool ok = true;
    ok = ok && (p.gate.getState() == GateState::CLOSED);
    ok = ok && (p.ledger.size() == before + 1);
    ok = ok && (alerts[0].level == AlertLevel::INFO);
    ok = ok && (alerts[0].message.find("door_closed") != std::string::npos);
    ok = ok && (p.actuator.getOpenCalls() == 1 && p.actuator.getCloseCalls() == 1);

    if (ok) {
        PASS();
    } else {
        FAIL("Tie-break not applied");
    }
}

void test_conflict_never_opens_closed_gate() {
    TEST("Detection {dog, cat} on closed gate stays closed");

    Pipeline p;
    p.source.pushFrame({"cat", "dog"});

    p.loop.runOnce();
    auto alerts = p.ledger.listAlerts();

    bool ok = true;
    ok = ok && (p.gate.getState() == GateState::CLOSED);
    ok = ok && (p.actuator.getOpenCalls() == 0);
    ok = ok && (alerts.size() == 1);
    ok = ok && (alerts[0].message.find("already closed") != std::string::npos);

    if (ok) {
        PASS();
    } else {
        FAIL("Gate opened on conflict");
    }
}

void test_no_match_no_action() {
    TEST("Unmatched labels leave the gate alone");

    Pipeline p;
    p.source.pushFrame({"bird"});

    auto result = p.loop.runOnce();

    bool ok = true;
    ok = ok && (result == DetectionLoop::CycleResult::PROCESSED);
    ok = ok && (p.ledger.size() == 0);
    ok = ok && (p.actuator.getOpenCalls() == 0 && p.actuator.getCloseCalls() == 0);
    ok = ok && (p.telemetry.getDetectionCount() == 1);
    ok = ok && p.loop.latestDetection().has_value();

    if (ok) {
        PASS();
    } else {
        FAIL("Unexpected action");
    }
}

void test_idle_cycle() {
    TEST("Idle poll reports nothing");

    Pipeline p;
    p.source.pushIdle();

    auto result = p.loop.runOnce();
    p.relay.waitIdle(2000);

    bool ok = true;
    ok = ok && (result == DetectionLoop::CycleResult::IDLE);
    ok = ok && (p.ledger.size() == 0);
    ok = ok && p.transport.published().empty();
    ok = ok && !p.loop.latestDetection().has_value();

    if (ok) {
        PASS();
    } else {
        FAIL("Idle cycle had effects");
    }
}

void test_engine_error_continues() {
    TEST("Engine error becomes warning, loop continues");

    Pipeline p;
    p.source.pushError("camera read failed");
    p.source.pushFrame({"dog"});

    auto first = p.loop.runOnce();
    auto second = p.loop.runOnce();

    bool found = false;
    for (const Alert &alert : p.ledger.listAlerts()) {
        if (alert.level == AlertLevel::WARNING &&
            alert.message.find("camera read failed") != std::string::npos) {
            found = true;
        }
    }

    bool ok = found;
    ok = ok && (first == DetectionLoop::CycleResult::FAILED);
    ok = ok && (second == DetectionLoop::CycleResult::PROCESSED);
    ok = ok && (p.gate.getState() == GateState::OPEN);
    ok = ok && (p.telemetry.getEngineErrorCount() == 1);

    if (ok) {
        PASS();
    } else {
        FAIL("Error handling wrong");
    }
}

void test_actuator_failure_is_not_fatal() {
    TEST("Actuator failure does not stop the loop");

    Pipeline p;
    p.actuator.setFail(true);
    p.source.pushFrame({"dog"});
    p.source.pushFrame({"dog"});

    auto first = p.loop.runOnce();
    p.actuator.setFail(false);
    auto second = p.loop.runOnce();

    bool ok = true;
    ok = ok && (first == DetectionLoop::CycleResult::PROCESSED);
    ok = ok && (second == DetectionLoop::CycleResult::PROCESSED);
    ok = ok && (p.count(AlertLevel::CRITICAL) == 1);
    ok = ok && (p.gate.getState() == GateState::OPEN);

    if (ok) {
        PASS();
    } else {
        FAIL("Failure propagated");
    }
}

void test_detection_reported() {
    TEST("Detections reported to relay");

    Pipeline p;
    p.source.pushFrame({"dog", "person"});

    p.loop.runOnce();
    p.relay.waitIdle(2000);

    auto msgs = p.transport.publishedTo("smartgate/1/detection");
    auto latest = p.loop.latestDetection();

    bool ok = true;
    ok = ok && (msgs.size() == 1);
    if (ok) {
        json det = json::parse(msgs[0].payload);
        ok = (det["objects"].size() == 2) && (det["gate"] == "1");
    }
    ok = ok && latest.has_value() && latest->contains("person");

    if (ok) {
        PASS();
    } else {
        FAIL("Detection not reported");
    }
}

void test_relay_outage_does_not_delay() {
    TEST("Relay outage does not delay gate actuation");

    RelayConfig cfg;
    cfg.publish_timeout_ms = 1000;
    Pipeline p(cfg);
    p.transport.setStallMs(1000);

    for (int i = 0; i < 5; i++) {
        p.source.pushFrame({"dog"});
        p.source.pushFrame({"cat"});
    }

    auto t0 = std::chrono::steady_clock::now();
    for (int i = 0; i < 10; i++) {
        p.loop.runOnce();
    }
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    bool ok = true;
    ok = ok && (took < 500);
    ok = ok && (p.actuator.getOpenCalls() == 5 && p.actuator.getCloseCalls() == 5);
    ok = ok && (p.count(AlertLevel::WARNING) == 0);
    ok = ok && (p.count(AlertLevel::CRITICAL) == 0);

    if (ok) {
        PASS();
    } else {
        FAIL("Loop waited on relay");
    }
}

void test_run_stops_on_shutdown() {
    TEST("Run exits when shutdown is set");

    Pipeline p;
    p.loop.setPollTimeoutMs(10);
    p.source.pushFrame({"dog"});

    std::atomic<bool> shutdown{false};
    std::thread worker([&]() { p.loop.run(shutdown); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    shutdown.store(true);
    worker.join();

    bool ok = true;
    ok = ok && (p.gate.getState() == GateState::OPEN);
    ok = ok && (p.source.remaining() == 0);

    if (ok) {
        PASS();
    } else {
        FAIL("Run loop misbehaved");
    }
}

int main() {
    printf("=== Detection Loop Tests ===\n");
    Logger::instance().setConsoleEnabled(false);

    test_dog_opens_gate();
    test_dog_and_cat_closes_gate();
    test_conflict_never_opens_closed_gate();
    test_no_match_no_action();
    test_idle_cycle();
    test_engine_error_continues();
    test_actuator_failure_is_not_fatal();
    test_detection_reported();
    test_relay_outage_does_not_delay();
    test_run_stops_on_shutdown();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
