#include "simulated_actuator.hpp"
#include "logger.h"

bool SimulatedActuator::open() {
    m_open_count++;
    LOG_INFO("SimMotor", "open (#%u)", m_open_count.load());
    return true;
}

bool SimulatedActuator::close() {
    m_close_count++;
    LOG_INFO("SimMotor", "close (#%u)", m_close_count.load());
    return true;
}
