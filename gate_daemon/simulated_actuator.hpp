#ifndef SIMULATED_ACTUATOR_HPP
#define SIMULATED_ACTUATOR_HPP

#include <atomic>
#include <cstdint>

#include "actuator.hpp"

/**
 * SimulatedActuator - Logs motions instead of touching GPIO (--simulate)
 */
class SimulatedActuator : public Actuator {
public:
    bool open() override;
    bool close() override;

    uint32_t getOpenCount() const { return m_open_count.load(); }
    uint32_t getCloseCount() const { return m_close_count.load(); }

private:
    std::atomic<uint32_t> m_open_count{0};
    std::atomic<uint32_t> m_close_count{0};
};

#endif // SIMULATED_ACTUATOR_HPP
