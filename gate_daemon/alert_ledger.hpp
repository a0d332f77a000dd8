#ifndef ALERT_LEDGER_HPP
#define ALERT_LEDGER_HPP

#include <cstdint>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Alert severity as shown on the dashboard.
 */
enum class AlertLevel {
    INFO,
    WARNING,
    CRITICAL
};

const char *alertLevelToString(AlertLevel level);
std::optional<AlertLevel> parseAlertLevel(const std::string &name);

/**
 * One ledger entry. Never modified after creation.
 */
struct Alert {
    uint64_t id = 0;
    std::string message;
    AlertLevel level = AlertLevel::INFO;
    uint64_t timestamp_ms = 0;  // wall clock, ms since epoch
};

/**
 * AlertLedger - Bounded, newest-first audit trail of system events
 *
 * Insert and evict happen under one lock, so readers never see a
 * partially evicted sequence. Ids start at 1 and are never reused.
 */
class AlertLedger {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    using Listener = std::function<void(const Alert &alert)>;

    explicit AlertLedger(size_t capacity = DEFAULT_CAPACITY);

    /**
     * Record an alert; evicts the oldest entry when full.
     * The listener (if any) runs after the lock is released.
     */
    Alert addAlert(const std::string &message, AlertLevel level);

    /**
     * Snapshot of the ledger, newest first. limit == 0 returns everything.
     */
    std::vector<Alert> listAlerts(size_t limit = 0) const;

    size_t size() const;
    size_t capacity() const { return m_capacity; }
    uint64_t lastId() const;

    void setListener(Listener listener);

private:
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::deque<Alert> m_alerts;  // front = newest
    uint64_t m_next_id = 1;
    Listener m_listener;
};

#endif // ALERT_LEDGER_HPP
