#ifndef GPIO_BACKEND_HPP
#define GPIO_BACKEND_HPP

#include <memory>
#include <string>

/**
 * GPIO Backend Interface
 *
 * Pin-level access for the gate motor driver and limit sensors.
 */
class GpioBackend {
public:
    virtual ~GpioBackend() = default;

    enum class Direction {
        INPUT,
        OUTPUT
    };

    /**
     * Initialize GPIO subsystem.
     */
    virtual bool init() = 0;

    /**
     * Export and configure a GPIO pin.
     */
    virtual bool configurePin(int pin, Direction dir) = 0;

    /**
     * Write to output pin (0 or 1).
     */
    virtual bool write(int pin, int value) = 0;

    /**
     * Read from input pin. Returns -1 on error.
     */
    virtual int read(int pin) = 0;

    /**
     * Release all configured pins.
     */
    virtual void cleanup() = 0;
};

/**
 * Sysfs backend rooted at /sys/class/gpio (root overridable for tests).
 */
std::unique_ptr<GpioBackend> createSysfsGpioBackend(const std::string &root = "/sys/class/gpio");

#endif // GPIO_BACKEND_HPP
