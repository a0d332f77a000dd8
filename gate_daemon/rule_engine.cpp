/**
 * RuleEngine Implementation
 */

#include "rule_engine.hpp"

#include <algorithm>
#include <cctype>

const char *gateActionToString(GateAction action) {
    switch (action) {
        case GateAction::OPEN:  return "OPEN";
        case GateAction::CLOSE: return "CLOSE";
    }
    return "?";
}

std::optional<GateAction> parseGateAction(const std::string &name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper == "OPEN") return GateAction::OPEN;
    if (upper == "CLOSE") return GateAction::CLOSE;
    return std::nullopt;
}

RuleEngine::RuleEngine(std::vector<Rule> rules) : m_rules(std::move(rules)) {
}

std::optional<GateAction> RuleEngine::evaluate(const DetectionSet &detections) const {
    return evaluate(detections, m_rules);
}

std::optional<GateAction> RuleEngine::evaluate(const DetectionSet &detections,
                                               const std::vector<Rule> &rules) {
    std::optional<GateAction> result;

    for (const Rule &rule : rules) {
        if (!isValid(rule) || !matches(rule, detections)) {
            continue;
        }
        // CLOSE dominates: once seen, nothing can override it
        if (rule.action == GateAction::CLOSE) {
            return GateAction::CLOSE;
        }
        result = GateAction::OPEN;
    }

    return result;
}

bool RuleEngine::isValid(const Rule &rule) {
    return !rule.trigger_labels.empty();
}

bool RuleEngine::matches(const Rule &rule, const DetectionSet &detections) {
    for (const std::string &label : rule.trigger_labels) {
        if (!detections.contains(label)) {
            return false;
        }
    }
    return true;
}
