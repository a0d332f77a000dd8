#ifndef ACTUATOR_HPP
#define ACTUATOR_HPP

/**
 * Actuator - Physical gate drive
 *
 * open()/close() start the motion and return quickly; false means the
 * drive could not be commanded. tick() is called from the main loop to
 * finish a motion (limit sensor or travel timeout).
 */
class Actuator {
public:
    virtual ~Actuator() = default;

    virtual bool open() = 0;
    virtual bool close() = 0;

    virtual void tick() {}

    /**
     * De-energize the motor immediately (shutdown path).
     */
    virtual void stopMotor() {}
};

#endif // ACTUATOR_HPP
