/**
 * Rule Engine Unit Tests
 */

#include <cstdio>
#include "../gate_daemon/rule_engine.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

static Rule makeRule(std::initializer_list<const char *> labels, GateAction action) {
    Rule rule;
    for (const char *label : labels) {
        rule.trigger_labels.insert(label);
    }
    rule.action = action;
    return rule;
}

static DetectionSet makeSet(std::initializer_list<const char *> labels) {
    DetectionSet ds;
    for (const char *label : labels) {
        ds.add(label, 0.9f);
    }
    return ds;
}

static std::vector<Rule> defaultRules() {
    return {
        makeRule({"dog"}, GateAction::OPEN),
        makeRule({"cat"}, GateAction::CLOSE)
    };
}

void test_single_match() {
    TEST("Single matching rule");

    RuleEngine engine(defaultRules());

    auto open = engine.evaluate(makeSet({"dog"}));
    auto close = engine.evaluate(makeSet({"cat"}));

    bool ok = true;
    ok = ok && open.has_value() && (*open == GateAction::OPEN);
    ok = ok && close.has_value() && (*close == GateAction::CLOSE);

    if (ok) {
        PASS();
    } else {
        FAIL("Wrong action");
    }
}

void test_close_wins_conflict() {
    TEST("Conflicting rules resolve to CLOSE");

    RuleEngine engine(defaultRules());
    auto action = engine.evaluate(makeSet({"dog", "cat"}));

    // Order of rules must not matter
    std::vector<Rule> reversed = {
        makeRule({"cat"}, GateAction::CLOSE),
        makeRule({"dog"}, GateAction::OPEN)
    };
    auto action2 = RuleEngine::evaluate(makeSet({"cat", "dog"}), reversed);

    bool ok = true;
    ok = ok && action.has_value() && (*action == GateAction::CLOSE);
    ok = ok && action2.has_value() && (*action2 == GateAction::CLOSE);

    if (ok) {
        PASS();
    } else {
        FAIL("OPEN won a conflict");
    }
}

void test_no_match() {
    TEST("No matching rule yields no action");

    RuleEngine engine(defaultRules());

    bool ok = true;
    ok = ok && !engine.evaluate(makeSet({"bird"})).has_value();
    ok = ok && !engine.evaluate(DetectionSet()).has_value();
    ok = ok && !RuleEngine::evaluate(makeSet({"dog"}), {}).has_value();

    if (ok) {
        PASS();
    } else {
        FAIL("Unexpected action");
    }
}

void test_all_labels_required() {
    TEST("Rule needs every trigger label");

    std::vector<Rule> rules = {makeRule({"dog", "person"}, GateAction::OPEN)};

    bool ok = true;
    ok = ok && !RuleEngine::evaluate(makeSet({"dog"}), rules).has_value();
    ok = ok && RuleEngine::evaluate(makeSet({"dog", "person", "bird"}), rules).has_value();

    if (ok) {
        PASS();
    } else {
        FAIL("Subset matching wrong");
    }
}

void test_degenerate_rule() {
    TEST("Rule without labels never matches");

    Rule empty;
    empty.action = GateAction::OPEN;
    std::vector<Rule> rules = {empty};

    bool ok = true;
    ok = ok && !RuleEngine::isValid(empty);
    ok = ok && !RuleEngine::evaluate(makeSet({"dog"}), rules).has_value();
    ok = ok && !RuleEngine::evaluate(DetectionSet(), rules).has_value();

    if (ok) {
        PASS();
    } else {
        FAIL("Empty rule fired");
    }
}

void test_duplicate_labels_collapse() {
    TEST("Duplicate labels keep highest confidence");

    DetectionSet ds;
    ds.add("dog", 0.6f);
    ds.add("dog", 0.8f);
    ds.add("dog", 0.7f);

    bool ok = true;
    ok = ok && (ds.size() == 1);
    ok = ok && (ds.labels["dog"] > 0.79f && ds.labels["dog"] < 0.81f);

    if (ok) {
        PASS();
    } else {
        FAIL("Labels not collapsed");
    }
}

void test_parse_action_names() {
    TEST("Parse action names");

    bool ok = true;
    ok = ok && (parseGateAction("OPEN") == GateAction::OPEN);
    ok = ok && (parseGateAction("close") == GateAction::CLOSE);
    ok = ok && !parseGateAction("toggle").has_value();
    ok = ok && (std::string(gateActionToString(GateAction::CLOSE)) == "CLOSE");

    if (ok) {
        PASS();
    } else {
        FAIL("Parsing wrong");
    }
}

int main() {
    printf("=== Rule Engine Tests ===\n");

    test_single_match();
    test_close_wins_conflict();
    test_no_match();
    test_all_labels_required();
    test_degenerate_rule();
    test_duplicate_labels_collapse();
    test_parse_action_names();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
