/**
 * Socket Detection Source Unit Tests
 */

#include <cstdio>
#include <cstring>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include "../gate_daemon/logger.h"
#include "../gate_daemon/socket_detection_source.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

static std::string socketPath() {
    return "/tmp/smartgate_detect_test_" + std::to_string(getpid()) + ".sock";
}

static int connectEngine(const std::string &path) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

static bool writeAll(int fd, const std::string &data) {
    return write(fd, data.data(), data.size()) == (ssize_t)data.size();
}

/**
 * Poll until a frame arrives or the attempts run out.
 */
static std::optional<DetectionSet> waitFrame(SocketDetectionSource &source) {
    for (int i = 0; i < 20; i++) {
        auto frame = source.nextDetections(50);
        if (frame) return frame;
    }
    return std::nullopt;
}

void test_no_engine_is_idle() {
    TEST("No engine connected -> idle");

    SocketDetectionSource source(socketPath(), 0.5f);
    bool ok = source.open();
    ok = ok && !source.nextDetections(20).has_value();
    ok = ok && !source.hasEngine();
    source.close();

    ok = ok && (access(socketPath().c_str(), F_OK) != 0);

    if (ok) {
        PASS();
    } else {
        FAIL("Idle handling wrong");
    }
}

void test_receive_frames() {
    TEST("Receive line-delimited frames");

    SocketDetectionSource source(socketPath(), 0.5f);
    bool ok = source.open();

    int engine = connectEngine(socketPath());
    ok = ok && (engine >= 0);

    // First poll accepts the engine
    source.nextDetections(100);
    ok = ok && source.hasEngine();

    ok = ok && writeAll(engine, "{\"objects\":[\"dog\",\"cat\"],\"confidence\":[0.9,0.2]}\n"
                                "{\"objects\":[\"cat\"],\"confidence\":[0.8]}\n");

    auto first = waitFrame(source);
    auto second = waitFrame(source);

    ok = ok && first.has_value() && first->contains("dog") && !first->contains("cat");
    ok = ok && second.has_value() && second->contains("cat");

    if (engine >= 0) close(engine);
    source.close();

    if (ok) {
        PASS();
    } else {
        FAIL("Frames not received");
    }
}

void test_engine_error_and_disconnect() {
    TEST("Engine error and disconnect raise DetectionError");

    SocketDetectionSource source(socketPath(), 0.5f);
    bool ok = source.open();

    int engine = connectEngine(socketPath());
    ok = ok && (engine >= 0);
    source.nextDetections(100);
    ok = ok && writeAll(engine, "{\"error\":\"camera unplugged\"}\n");

    bool engine_error = false;
    for (int i = 0; i < 20 && !engine_error; i++) {
        try {
            source.nextDetections(50);
        } catch (const DetectionError &e) {
            engine_error = std::string(e.what()).find("camera unplugged") != std::string::npos;
        }
    }

    if (engine >= 0) close(engine);

    bool disconnected = false;
    for (int i = 0; i < 20 && !disconnected; i++) {
        try {
            source.nextDetections(50);
        } catch (const DetectionError &) {
            disconnected = true;
        }
    }

    ok = ok && engine_error && disconnected;
    ok = ok && !source.hasEngine();

    // A new engine may connect afterwards
    int again = connectEngine(socketPath());
    source.nextDetections(100);
    ok = ok && (again >= 0) && source.hasEngine();
    if (again >= 0) close(again);

    source.close();

    if (ok) {
        PASS();
    } else {
        FAIL("Failure handling wrong");
    }
}

int main() {
    printf("=== Socket Detection Source Tests ===\n");
    Logger::instance().setConsoleEnabled(false);

    test_no_engine_is_idle();
    test_receive_frames();
    test_engine_error_and_disconnect();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
