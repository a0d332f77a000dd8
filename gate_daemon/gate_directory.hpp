#ifndef GATE_DIRECTORY_HPP
#define GATE_DIRECTORY_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "alert_ledger.hpp"
#include "relay_transport.hpp"

struct GateInfo {
    std::string gate_id;
    bool online = false;
    uint64_t last_seen_ms = 0;             // wall clock
    std::string gate_status = "unknown";   // "open" / "closed" / "unknown"
};

/**
 * GateDirectory - Gates discovered from their relay traffic
 *
 * A gate goes offline after OFFLINE_AFTER_MS without any message.
 * Status changes and detections of other gates are added to the ledger.
 */
class GateDirectory {
public:
    static constexpr uint64_t OFFLINE_AFTER_MS = 30000;

    GateDirectory(const std::string &topic_prefix, const std::string &local_gate_id, AlertLedger &ledger);

    /**
     * Subscribe to every gate's heartbeat, status and detection topics.
     */
    bool attach(RelayTransport &transport);

    void onMessage(const std::string &topic, const std::string &payload);
    void onMessage(const std::string &topic, const std::string &payload, uint64_t now_ms);

    /**
     * Mark silent gates offline.
     */
    void sweep();
    void sweep(uint64_t now_ms);

    std::vector<GateInfo> gates() const;
    std::optional<GateInfo> find(const std::string &gate_id) const;

    static std::string normalizeStatus(const std::string &status);

private:
    GateInfo &touch(const std::string &gate_id, uint64_t now_ms);
    static uint64_t wall_ms();

    const std::string m_prefix;
    const std::string m_local_gate_id;
    AlertLedger &m_ledger;

    mutable std::mutex m_mutex;
    std::map<std::string, GateInfo> m_gates;
};

#endif // GATE_DIRECTORY_HPP
