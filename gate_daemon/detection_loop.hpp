#ifndef DETECTION_LOOP_HPP
#define DETECTION_LOOP_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

#include "alert_ledger.hpp"
#include "detection.hpp"
#include "gate_controller.hpp"
#include "relay_client.hpp"
#include "rule_engine.hpp"
#include "telemetry.hpp"

/**
 * DetectionLoop - detection -> rules -> gate -> relay
 *
 * A failing cycle becomes a warning alert; nothing here stops the loop.
 */
class DetectionLoop {
public:
    enum class CycleResult {
        IDLE,       // no frame within the poll timeout
        PROCESSED,  // frame handled (empty or not)
        FAILED      // engine or gate error, converted to an alert
    };

    DetectionLoop(DetectionSource &source, const RuleEngine &rules, GateController &gate,
                  RelayClient &relay, AlertLedger &ledger, Telemetry &telemetry);

    void setPollTimeoutMs(int timeout_ms) { m_poll_timeout_ms = timeout_ms; }

    CycleResult runOnce();

    /**
     * Run until shutdown is set. The current cycle always completes.
     */
    void run(const std::atomic<bool> &shutdown);

    /**
     * Most recent non-empty detection set, if any.
     */
    std::optional<DetectionSet> latestDetection() const;

private:
    void process(const DetectionSet &detections);
    static std::string joinLabels(const DetectionSet &detections);

    DetectionSource &m_source;
    const RuleEngine &m_rules;
    GateController &m_gate;
    RelayClient &m_relay;
    AlertLedger &m_ledger;
    Telemetry &m_telemetry;

    int m_poll_timeout_ms = 200;

    mutable std::mutex m_latest_mutex;
    std::optional<DetectionSet> m_latest;
};

#endif // DETECTION_LOOP_HPP
