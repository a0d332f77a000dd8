#ifndef TELEMETRY_HPP
#define TELEMETRY_HPP

#include <atomic>
#include <cstdint>

/**
 * Telemetry - Process status and detection counters
 *
 * tick() belongs to the detection loop thread; getters may be called
 * from anywhere.
 */
class Telemetry {
public:
    Telemetry();

    /**
     * Called once per detection cycle.
     */
    void tick();

    /**
     * Get uptime in seconds.
     */
    uint32_t getUptimeSeconds() const;

    /**
     * Detection cycles per second, refreshed every second.
     */
    float getCycleHz() const { return m_cycle_hz.load(); }

    uint64_t getCycleCount() const { return m_cycles.load(); }

    void incrementDetections() { m_detections++; }
    uint32_t getDetectionCount() const { return m_detections.load(); }

    void incrementActions() { m_actions++; }
    uint32_t getActionCount() const { return m_actions.load(); }

    void incrementEngineErrors() { m_engine_errors++; }
    uint32_t getEngineErrorCount() const { return m_engine_errors.load(); }

private:
    uint64_t m_start_time_ms = 0;

    std::atomic<uint64_t> m_cycles{0};
    std::atomic<uint32_t> m_detections{0};
    std::atomic<uint32_t> m_actions{0};
    std::atomic<uint32_t> m_engine_errors{0};

    uint32_t m_tick_count = 0;
    uint64_t m_last_hz_calc_ms = 0;
    std::atomic<float> m_cycle_hz{0.0f};
};

#endif // TELEMETRY_HPP
