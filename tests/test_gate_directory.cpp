/**
 * Gate Directory Unit Tests
 */

#include <cstdio>
#include "../gate_daemon/gate_directory.hpp"
#include "../gate_daemon/logger.h"
#include "mocks/mock_transport.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

void test_attach_subscribes() {
    TEST("Attach subscribes to all gates");

    AlertLedger ledger;
    GateDirectory directory("smartgate", "1", ledger);
    MockTransport transport;

    bool attached = directory.attach(transport);
    auto filters = transport.filters();

    bool ok = attached;
    ok = ok && (filters.size() == 3);
    ok = ok && (transport.deliver("smartgate/4/heartbeat", R"({"gate_id":"4","gate_status":"open"})") == 1);
    ok = ok && directory.find("4").has_value();
    ok = ok && (directory.find("4")->gate_status == "open");

    if (ok) {
        PASS();
    } else {
        FAIL("Subscriptions wrong");
    }
}

void test_remote_status_alert() {
    TEST("Remote status change is audited");

    AlertLedger ledger;
    GateDirectory directory("smartgate", "1", ledger);

    directory.onMessage("smartgate/2/status", R"({"gate":"2","status":"door_opened"})", 1000);
    auto info = directory.find("2");
    auto alerts = ledger.listAlerts();

    bool ok = true;
    ok = ok && info.has_value() && info->online;
    ok = ok && (info->gate_status == "open");
    ok = ok && (info->last_seen_ms == 1000);
    ok = ok && (alerts.size() == 1);
    ok = ok && (alerts[0].message == "Gate 2 status: door_opened");
    ok = ok && (alerts[0].level == AlertLevel::INFO);

    if (ok) {
        PASS();
    } else {
        FAIL("Status not recorded");
    }
}

void test_remote_detection_alert() {
    TEST("Remote detection is audited as warning");

    AlertLedger ledger;
    GateDirectory directory("smartgate", "1", ledger);

    directory.onMessage("smartgate/2/detection", R"({"objects":["dog","cat"],"confidence":[0.9,0.8]})", 1000);
    directory.onMessage("smartgate/2/detection", R"({"objects":[]})", 1100);
    auto alerts = ledger.listAlerts();

    bool ok = true;
    ok = ok && (alerts.size() == 1);
    ok = ok && (alerts[0].message == "Gate 2: Animal detected: dog, cat");
    ok = ok && (alerts[0].level == AlertLevel::WARNING);

    if (ok) {
        PASS();
    } else {
        FAIL("Detection not audited");
    }
}

void test_local_gate_not_audited() {
    TEST("Own traffic tracked but not re-audited");

    AlertLedger ledger;
    GateDirectory directory("smartgate", "1", ledger);

    directory.onMessage("smartgate/1/status", R"({"status":"door_closed"})", 1000);
    directory.onMessage("smartgate/1/detection", R"({"objects":["dog"]})", 1000);

    bool ok = true;
    ok = ok && (ledger.size() == 0);
    ok = ok && directory.find("1").has_value();
    ok = ok && (directory.find("1")->gate_status == "closed");

    if (ok) {
        PASS();
    } else {
        FAIL("Own messages audited");
    }
}

void test_offline_sweep() {
    TEST("Silent gate goes offline, returns on traffic");

    AlertLedger ledger;
    GateDirectory directory("smartgate", "1", ledger);

    directory.onMessage("smartgate/3/heartbeat", R"({"gate_status":"closed"})", 1000);
    directory.sweep(1000 + GateDirectory::OFFLINE_AFTER_MS);
    bool still_online = directory.find("3")->online;

    directory.sweep(1001 + GateDirectory::OFFLINE_AFTER_MS);
    bool offline = !directory.find("3")->online;

    directory.onMessage("smartgate/3/heartbeat", R"({"gate_status":"open"})", 40000);
    bool back = directory.find("3")->online;

    // A sweep with an older clock must not underflow
    directory.sweep(500);

    bool ok = still_online && offline && back;
    ok = ok && directory.find("3")->online;
    ok = ok && (directory.gates().size() == 1);

    if (ok) {
        PASS();
    } else {
        FAIL("Offline detection wrong");
    }
}

void test_ignores_garbage() {
    TEST("Ignore foreign topics and bad payloads");

    AlertLedger ledger;
    GateDirectory directory("smartgate", "1", ledger);

    directory.onMessage("other/2/status", R"({"status":"door_opened"})", 1000);
    directory.onMessage("smartgate/2/status", "not json", 1000);
    directory.onMessage("smartgate/2/status", "[]", 1000);

    bool ok = true;
    ok = ok && directory.gates().empty();
    ok = ok && (ledger.size() == 0);

    if (ok) {
        PASS();
    } else {
        FAIL("Garbage accepted");
    }
}

void test_normalize_status() {
    TEST("Normalize status names");

    bool ok = true;
    ok = ok && (GateDirectory::normalizeStatus("door_opened") == "open");
    ok = ok && (GateDirectory::normalizeStatus("closed") == "closed");
    ok = ok && (GateDirectory::normalizeStatus("jammed") == "unknown");

    if (ok) {
        PASS();
    } else {
        FAIL("Normalization wrong");
    }
}

int main() {
    printf("=== Gate Directory Tests ===\n");
    Logger::instance().setConsoleEnabled(false);

    test_attach_subscribes();
    test_remote_status_alert();
    test_remote_detection_alert();
    test_local_gate_not_audited();
    test_offline_sweep();
    test_ignores_garbage();
    test_normalize_status();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
