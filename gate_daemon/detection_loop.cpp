/**
 * DetectionLoop Implementation
 */

#include "detection_loop.hpp"
#include "logger.h"

#include <stdexcept>
#include <unistd.h>

static const char *TAG = "Loop";

// Pause after a failed cycle so a dead engine cannot flood the ledger
static constexpr useconds_t FAILURE_PAUSE_US = 500 * 1000;

DetectionLoop::DetectionLoop(DetectionSource &source, const RuleEngine &rules, GateController &gate,
                             RelayClient &relay, AlertLedger &ledger, Telemetry &telemetry)
    : m_source(source), m_rules(rules), m_gate(gate), m_relay(relay),
      m_ledger(ledger), m_telemetry(telemetry) {}

std::string DetectionLoop::joinLabels(const DetectionSet &detections) {
    std::string out;
    for (const auto &entry : detections.labels) {
        if (!out.empty()) out += ", ";
        out += entry.first;
    }
    return out;
}

DetectionLoop::CycleResult DetectionLoop::runOnce() {
    try {
        std::optional<DetectionSet> detections = m_source.nextDetections(m_poll_timeout_ms);
        if (!detections) {
            return CycleResult::IDLE;
        }
        m_telemetry.tick();
        process(*detections);
        return CycleResult::PROCESSED;
    } catch (const DetectionError &e) {
        m_telemetry.incrementEngineErrors();
        m_ledger.addAlert(std::string("Detection failed: ") + e.what(), AlertLevel::WARNING);
    } catch (const std::invalid_argument &e) {
        m_ledger.addAlert(std::string("Rejected gate action: ") + e.what(), AlertLevel::WARNING);
    } catch (const std::exception &e) {
        m_ledger.addAlert(std::string("Detection cycle error: ") + e.what(), AlertLevel::WARNING);
    }
    return CycleResult::FAILED;
}

void DetectionLoop::process(const DetectionSet &detections) {
    if (detections.empty()) {
        return;
    }

    m_telemetry.incrementDetections();
    {
        std::lock_guard<std::mutex> lock(m_latest_mutex);
        m_latest = detections;
    }

    const std::string labels = joinLabels(detections);
    LOG_DEBUG(TAG, "Detected: %s", labels.c_str());

    std::optional<GateAction> action = m_rules.evaluate(detections);
    if (action) {
        m_telemetry.incrementActions();
        m_gate.applyAction(*action, "detection: " + labels);
    }

    m_relay.reportDetection(detections);
}

void DetectionLoop::run(const std::atomic<bool> &shutdown) {
    LOG_INFO(TAG, "Detection loop running (%zu rules)", m_rules.rules().size());

    while (!shutdown.load()) {
        if (runOnce() == CycleResult::FAILED) {
            usleep(FAILURE_PAUSE_US);
        }
    }

    LOG_INFO(TAG, "Detection loop stopped after %llu cycles",
             (unsigned long long)m_telemetry.getCycleCount());
}

std::optional<DetectionSet> DetectionLoop::latestDetection() const {
    std::lock_guard<std::mutex> lock(m_latest_mutex);
    return m_latest;
}
