#ifndef GATE_CONTROLLER_HPP
#define GATE_CONTROLLER_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "actuator.hpp"
#include "alert_ledger.hpp"
#include "rule_engine.hpp"

enum class GateState {
    CLOSED,
    OPEN
};

const char *gateStateToString(GateState state);

/**
 * GateController - Sole owner of one gate's recorded state
 *
 * applyAction() is mutually exclusive across callers: a concurrent call
 * waits, then sees the state left by the previous one. Every attempt,
 * no-op or not, leaves exactly one ledger entry.
 */
class GateController {
public:
    enum class Result {
        CHANGED,    // actuator commanded, state advanced
        NO_CHANGE,  // already in requested state
        FAILED      // actuator refused, state kept
    };

    /**
     * Called after a physical state change, outside the lock.
     */
    using StateCallback = std::function<void(const std::string &gate_id, GateState state)>;

    GateController(const std::string &gate_id, Actuator &actuator, AlertLedger &ledger);

    /**
     * Drive the gate toward the requested state.
     * source names the origin for the audit entry ("detection", "remote", ...).
     * Throws std::invalid_argument for an action outside GateAction.
     */
    Result applyAction(GateAction action, const std::string &source);

    GateState getState() const;
    uint64_t getLastChangeMs() const;
    const std::string &getGateId() const { return m_gate_id; }

    uint32_t getActuationCount() const;

    void setStateCallback(StateCallback cb);

private:
    static uint64_t wall_ms();

    const std::string m_gate_id;
    Actuator &m_actuator;
    AlertLedger &m_ledger;

    mutable std::mutex m_mutex;
    GateState m_state = GateState::CLOSED;
    uint64_t m_last_change_ms = 0;
    uint32_t m_actuation_count = 0;
    StateCallback m_state_cb;
};

#endif // GATE_CONTROLLER_HPP
