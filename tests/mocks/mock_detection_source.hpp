#ifndef MOCK_DETECTION_SOURCE_HPP
#define MOCK_DETECTION_SOURCE_HPP

#include <chrono>
#include <deque>
#include <initializer_list>
#include <optional>
#include <string>
#include <thread>

#include "../../gate_daemon/detection.hpp"

/**
 * MockDetectionSource - Replays a scripted sequence of frames and failures
 *
 * An exhausted script behaves like an idle engine: waits out the
 * timeout and returns nullopt.
 */
class MockDetectionSource : public DetectionSource {
public:
    struct Step {
        std::optional<DetectionSet> frame;
        std::string error;  // non-empty: throw DetectionError
    };

    void pushFrame(std::initializer_list<const char *> labels) {
        DetectionSet ds;
        for (const char *label : labels) {
            ds.add(label, 0.9f);
        }
        ds.timestamp = 1700000000.0;
        m_steps.push_back({ds, ""});
    }

    void pushIdle() {
        m_steps.push_back({std::nullopt, ""});
    }

    void pushError(const std::string &message) {
        m_steps.push_back({std::nullopt, message});
    }

    std::optional<DetectionSet> nextDetections(int timeout_ms) override {
        m_calls++;
        if (m_steps.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return std::nullopt;
        }
        Step step = m_steps.front();
        m_steps.pop_front();
        if (!step.error.empty()) {
            throw DetectionError(step.error);
        }
        return step.frame;
    }

    int getCalls() const { return m_calls; }
    size_t remaining() const { return m_steps.size(); }

private:
    std::deque<Step> m_steps;
    int m_calls = 0;
};

#endif // MOCK_DETECTION_SOURCE_HPP
