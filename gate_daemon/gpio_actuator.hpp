#ifndef GPIO_ACTUATOR_HPP
#define GPIO_ACTUATOR_HPP

#include <cstdint>
#include <mutex>

#include "actuator.hpp"
#include "gpio/gpio_backend.hpp"

struct GpioActuatorConfig {
    int enable_pin = -1;         // H-bridge enable (ENB), -1 = hard-wired
    int open_pin = -1;           // IN4
    int close_pin = -1;          // IN3
    int open_limit_pin = -1;     // hall sensor at the open end, -1 = none
    int closed_limit_pin = -1;   // hall sensor at the closed end, -1 = none
    int limit_active_value = 0;  // hall sensors pull low when triggered
    uint32_t travel_timeout_ms = 15000;
};

/**
 * GpioActuator - H-bridge gate motor on sysfs GPIO
 *
 * open()/close() set the direction pins and return. tick() cuts the motor
 * when the matching limit sensor triggers or the travel timeout expires.
 */
class GpioActuator : public Actuator {
public:
    enum class Motion {
        IDLE,
        OPENING,
        CLOSING
    };

    GpioActuator(GpioBackend &backend, const GpioActuatorConfig &config);
    ~GpioActuator() override;

    /**
     * Configure pins and leave the motor stopped.
     */
    bool init();

    bool open() override;
    bool close() override;
    void tick() override;
    void stopMotor() override;

    /**
     * Stop the motor and detach from the pins. Later calls are no-ops,
     * so the backend can unexport the pins afterwards.
     */
    void release();

    Motion motion() const;

private:
    bool drive(Motion motion);
    bool writeDirection(int open_level, int close_level);
    bool limitReached(Motion motion);
    static uint64_t now_ms();

    GpioBackend &m_backend;
    GpioActuatorConfig m_config;

    mutable std::mutex m_mutex;
    Motion m_motion = Motion::IDLE;
    uint64_t m_motion_start_ms = 0;
    bool m_initialized = false;
};

#endif // GPIO_ACTUATOR_HPP
