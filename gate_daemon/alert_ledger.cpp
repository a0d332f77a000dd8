/**
 * AlertLedger Implementation
 */

#include "alert_ledger.hpp"
#include "logger.h"

#include <chrono>
#include <stdexcept>

static const char *TAG = "Alert";

static uint64_t wall_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

const char *alertLevelToString(AlertLevel level) {
    switch (level) {
        case AlertLevel::INFO:     return "info";
        case AlertLevel::WARNING:  return "warning";
        case AlertLevel::CRITICAL: return "critical";
    }
    return "info";
}

std::optional<AlertLevel> parseAlertLevel(const std::string &name) {
    if (name == "info") return AlertLevel::INFO;
    if (name == "warning") return AlertLevel::WARNING;
    if (name == "critical") return AlertLevel::CRITICAL;
    return std::nullopt;
}

AlertLedger::AlertLedger(size_t capacity) : m_capacity(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("AlertLedger capacity must be at least 1");
    }
}

Alert AlertLedger::addAlert(const std::string &message, AlertLevel level) {
    Alert alert;
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        alert.id = m_next_id++;
        alert.message = message;
        alert.level = level;
        alert.timestamp_ms = wall_ms();

        m_alerts.push_front(alert);
        while (m_alerts.size() > m_capacity) {
            m_alerts.pop_back();
        }
        listener = m_listener;
    }

    switch (level) {
        case AlertLevel::INFO:
            LOG_INFO(TAG, "#%llu %s", (unsigned long long)alert.id, message.c_str());
            break;
        case AlertLevel::WARNING:
            LOG_WARN(TAG, "#%llu %s", (unsigned long long)alert.id, message.c_str());
            break;
        case AlertLevel::CRITICAL:
            LOG_ERROR(TAG, "#%llu CRITICAL %s", (unsigned long long)alert.id, message.c_str());
            break;
    }

    if (listener) {
        listener(alert);
    }
    return alert;
}

std::vector<Alert> AlertLedger::listAlerts(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = m_alerts.size();
    if (limit > 0 && limit < count) {
        count = limit;
    }
    return std::vector<Alert>(m_alerts.begin(), m_alerts.begin() + count);
}

size_t AlertLedger::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_alerts.size();
}

uint64_t AlertLedger::lastId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_next_id - 1;
}

void AlertLedger::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}
