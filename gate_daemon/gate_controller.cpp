/**
 * GateController Implementation
 */

#include "gate_controller.hpp"
#include "logger.h"

#include <chrono>
#include <exception>
#include <stdexcept>

static const char *TAG = "Gate";

const char *gateStateToString(GateState state) {
    switch (state) {
        case GateState::OPEN:   return "open";
        case GateState::CLOSED: return "closed";
    }
    return "unknown";
}

uint64_t GateController::wall_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

GateController::GateController(const std::string &gate_id, Actuator &actuator, AlertLedger &ledger)
    : m_gate_id(gate_id), m_actuator(actuator), m_ledger(ledger) {
    m_last_change_ms = wall_ms();
}

GateController::Result GateController::applyAction(GateAction action, const std::string &source) {
    GateState target = GateState::CLOSED;
    switch (action) {
        case GateAction::OPEN:  target = GateState::OPEN; break;
        case GateAction::CLOSE: target = GateState::CLOSED; break;
        default:
            throw std::invalid_argument("unknown gate action " +
                                        std::to_string(static_cast<int>(action)));
    }

    const bool opening = (target == GateState::OPEN);
    const std::string suffix = " (gate " + m_gate_id + ", " + source + ")";
    StateCallback cb;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_state == target) {
            m_ledger.addAlert(std::string(opening ? "already open" : "already closed") + suffix,
                              AlertLevel::INFO);
            return Result::NO_CHANGE;
        }

        bool ok = false;
        try {
            ok = opening ? m_actuator.open() : m_actuator.close();
        } catch (const std::exception &e) {
            LOG_ERROR(TAG, "Actuator threw: %s", e.what());
            ok = false;
        }

        if (!ok) {
            m_ledger.addAlert(std::string("actuator failed to ") + (opening ? "open" : "close") + suffix,
                              AlertLevel::CRITICAL);
            return Result::FAILED;
        }

        m_state = target;
        m_last_change_ms = wall_ms();
        m_actuation_count++;
        m_ledger.addAlert(std::string(opening ? "door_opened" : "door_closed") + suffix,
                          AlertLevel::INFO);
        cb = m_state_cb;
    }

    if (cb) {
        cb(m_gate_id, target);
    }
    return Result::CHANGED;
}

GateState GateController::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

uint64_t GateController::getLastChangeMs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_change_ms;
}

uint32_t GateController::getActuationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_actuation_count;
}

void GateController::setStateCallback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state_cb = std::move(cb);
}
