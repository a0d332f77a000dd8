#ifndef RULE_ENGINE_HPP
#define RULE_ENGINE_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "detection.hpp"

/**
 * Gate actuation requested by a rule or a remote command.
 */
enum class GateAction {
    OPEN,
    CLOSE
};

const char *gateActionToString(GateAction action);

/**
 * Parse "OPEN"/"CLOSE" (case-insensitive).
 */
std::optional<GateAction> parseGateAction(const std::string &name);

/**
 * Rule - Fires when every trigger label is present in a detection set
 */
struct Rule {
    std::set<std::string> trigger_labels;
    GateAction action = GateAction::CLOSE;
};

/**
 * RuleEngine - Maps a detection set to at most one gate action
 *
 * Matching rules with conflicting actions resolve to CLOSE.
 * No matching rule yields no action.
 */
class RuleEngine {
public:
    RuleEngine() = default;
    explicit RuleEngine(std::vector<Rule> rules);

    std::optional<GateAction> evaluate(const DetectionSet &detections) const;

    static std::optional<GateAction> evaluate(const DetectionSet &detections,
                                              const std::vector<Rule> &rules);

    /**
     * A rule with no trigger labels is degenerate and never matches.
     */
    static bool isValid(const Rule &rule);

    const std::vector<Rule> &rules() const { return m_rules; }

private:
    static bool matches(const Rule &rule, const DetectionSet &detections);

    std::vector<Rule> m_rules;
};

#endif // RULE_ENGINE_HPP
