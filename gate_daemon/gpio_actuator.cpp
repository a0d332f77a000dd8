/**
 * GpioActuator Implementation
 */

#include "gpio_actuator.hpp"
#include "logger.h"

#include <ctime>

static const char *TAG = "Motor";

uint64_t GpioActuator::now_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

GpioActuator::GpioActuator(GpioBackend &backend, const GpioActuatorConfig &config)
    : m_backend(backend), m_config(config) {
}

GpioActuator::~GpioActuator() {
    stopMotor();
}

bool GpioActuator::init() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_config.open_pin < 0 || m_config.close_pin < 0) {
        LOG_ERROR(TAG, "open_pin and close_pin must be configured");
        return false;
    }
    if (!m_backend.init()) {
        return false;
    }

    bool ok = true;
    if (m_config.enable_pin >= 0) {
        ok = ok && m_backend.configurePin(m_config.enable_pin, GpioBackend::Direction::OUTPUT);
    }
    ok = ok && m_backend.configurePin(m_config.open_pin, GpioBackend::Direction::OUTPUT);
    ok = ok && m_backend.configurePin(m_config.close_pin, GpioBackend::Direction::OUTPUT);
    if (m_config.open_limit_pin >= 0) {
        ok = ok && m_backend.configurePin(m_config.open_limit_pin, GpioBackend::Direction::INPUT);
    }
    if (m_config.closed_limit_pin >= 0) {
        ok = ok && m_backend.configurePin(m_config.closed_limit_pin, GpioBackend::Direction::INPUT);
    }
    if (!ok) {
        return false;
    }

    if (m_config.enable_pin >= 0 && !m_backend.write(m_config.enable_pin, 1)) {
        return false;
    }
    if (!writeDirection(0, 0)) {
        return false;
    }

    m_initialized = true;
    LOG_INFO(TAG, "Motor driver ready (open=%d close=%d enable=%d)",
             m_config.open_pin, m_config.close_pin, m_config.enable_pin);
    return true;
}

bool GpioActuator::open() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return drive(Motion::OPENING);
}

bool GpioActuator::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return drive(Motion::CLOSING);
}

bool GpioActuator::drive(Motion motion) {
    if (!m_initialized) {
        LOG_ERROR(TAG, "Motor driver not initialized");
        return false;
    }

    bool ok = (motion == Motion::OPENING) ? writeDirection(1, 0) : writeDirection(0, 1);
    if (!ok) {
        // Never leave one leg energized after a partial write
        if (!writeDirection(0, 0)) {
            LOG_ERROR(TAG, "Failed to release motor after drive error");
        }
        m_motion = Motion::IDLE;
        LOG_ERROR(TAG, "Failed to drive motor %s",
                  motion == Motion::OPENING ? "open" : "closed");
        return false;
    }

    m_motion = motion;
    m_motion_start_ms = now_ms();
    LOG_DEBUG(TAG, "Motor %s", motion == Motion::OPENING ? "opening" : "closing");
    return true;
}

void GpioActuator::tick() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_motion == Motion::IDLE) {
        return;
    }

    if (limitReached(m_motion)) {
        LOG_INFO(TAG, "Gate fully %s, stopping motor",
                 m_motion == Motion::OPENING ? "open" : "closed");
        if (!writeDirection(0, 0)) {
            LOG_ERROR(TAG, "Failed to stop motor at limit");
        }
        m_motion = Motion::IDLE;
        return;
    }

    if (now_ms() - m_motion_start_ms >= m_config.travel_timeout_ms) {
        int limit_pin = (m_motion == Motion::OPENING) ? m_config.open_limit_pin
                                                      : m_config.closed_limit_pin;
        if (limit_pin >= 0) {
            LOG_WARN(TAG, "Travel timeout (%u ms) without limit sensor, stopping motor",
                     m_config.travel_timeout_ms);
        }
        if (!writeDirection(0, 0)) {
            LOG_ERROR(TAG, "Failed to stop motor after travel");
        }
        m_motion = Motion::IDLE;
    }
}

void GpioActuator::stopMotor() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        return;
    }
    if (!writeDirection(0, 0)) {
        LOG_ERROR(TAG, "Failed to de-energize motor");
    }
    m_motion = Motion::IDLE;
}

void GpioActuator::release() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        return;
    }
    if (!writeDirection(0, 0)) {
        LOG_ERROR(TAG, "Failed to de-energize motor");
    }
    if (m_config.enable_pin >= 0 && !m_backend.write(m_config.enable_pin, 0)) {
        LOG_WARN(TAG, "Failed to clear enable pin %d", m_config.enable_pin);
    }
    m_motion = Motion::IDLE;
    m_initialized = false;
}

GpioActuator::Motion GpioActuator::motion() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_motion;
}

bool GpioActuator::writeDirection(int open_level, int close_level) {
    // Release the active leg first so both are never high together
    bool ok = true;
    if (open_level == 0) ok = m_backend.write(m_config.open_pin, 0) && ok;
    if (close_level == 0) ok = m_backend.write(m_config.close_pin, 0) && ok;
    if (open_level != 0) ok = ok && m_backend.write(m_config.open_pin, 1);
    if (close_level != 0) ok = ok && m_backend.write(m_config.close_pin, 1);
    return ok;
}

bool GpioActuator::limitReached(Motion motion) {
    int pin = (motion == Motion::OPENING) ? m_config.open_limit_pin : m_config.closed_limit_pin;
    if (pin < 0) {
        return false;
    }
    return m_backend.read(pin) == m_config.limit_active_value;
}
