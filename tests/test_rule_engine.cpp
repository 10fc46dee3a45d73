#include <catch2/catch.hpp>

#include "and_condition.hpp"
#include "at_least_condition.hpp"
#include "fact_condition.hpp"
#include "label_condition.hpp"
#include "or_condition.hpp"
#include "rule.hpp"
#include "rule_factory.hpp"
#include "rule_list.hpp"

#include <memory>
#include <stdexcept>

using namespace rule_engine;

namespace {

    std::unique_ptr<ICondition> fact(const std::string& name, ComparisonOp op, double value) {
        return std::make_unique<FactCondition>(name, op, value);
    }

    FactSnapshot sampleFacts() {
        FactSnapshot facts;
        facts.set("rsi", 72.5);
        facts.set("close", 10.0);
        facts.set("ema_9", 9.5);
        facts.setFlag("breakout", true);
        facts.setLabel("grade", "A");
        return facts;
    }

} // namespace

TEST_CASE("Comparison operators", "[rule_engine]") {
    REQUIRE(stringToCompOp(">=") == ComparisonOp::GTE);
    REQUIRE(stringToCompOp("LT") == ComparisonOp::LT);
    REQUIRE_THROWS_AS(stringToCompOp("=>"), std::invalid_argument);

    REQUIRE(compare(1.0, ComparisonOp::EQ, 1.0 + 1e-12));
    REQUIRE_FALSE(compare(1.0, ComparisonOp::GT, 1.0));
    REQUIRE(compare(1.0, ComparisonOp::GTE, 1.0));
}

TEST_CASE("Fact and label conditions", "[rule_engine]") {
    const auto facts = sampleFacts();

    REQUIRE(FactCondition("rsi", ComparisonOp::GT, 70.0).evaluate(facts));
    REQUIRE(FactCondition("close", ComparisonOp::GT, std::string("ema_9")).evaluate(facts));
    REQUIRE(FactCondition("breakout", ComparisonOp::EQ, 1.0).evaluate(facts));

    SECTION("missing facts never hold") {
        REQUIRE_FALSE(FactCondition("volume", ComparisonOp::GT, 0.0).evaluate(facts));
        REQUIRE_FALSE(FactCondition("close", ComparisonOp::GT, std::string("ema_200")).evaluate(facts));
    }

    SECTION("labels") {
        REQUIRE(LabelCondition("grade", {"A+", "A"}).evaluate(facts));
        REQUIRE_FALSE(LabelCondition("grade", {"B"}).evaluate(facts));
        REQUIRE_FALSE(LabelCondition("trend", {"bullish"}).evaluate(facts));
    }

    SECTION("construction errors") {
        REQUIRE_THROWS_AS(FactCondition("", ComparisonOp::GT, 1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(FactCondition("rsi", ComparisonOp::GT, std::string("rsi")), std::invalid_argument);
        REQUIRE_THROWS_AS(LabelCondition("grade", {}), std::invalid_argument);
    }
}

TEST_CASE("Composite conditions", "[rule_engine]") {
    const auto facts = sampleFacts();

    std::vector<std::unique_ptr<ICondition>> both;
    both.push_back(fact("rsi", ComparisonOp::GT, 70.0));
    both.push_back(fact("close", ComparisonOp::LT, 5.0));
    REQUIRE_FALSE(AndCondition(std::move(both)).evaluate(facts));

    std::vector<std::unique_ptr<ICondition>> either;
    either.push_back(fact("rsi", ComparisonOp::GT, 70.0));
    either.push_back(fact("close", ComparisonOp::LT, 5.0));
    REQUIRE(OrCondition(std::move(either)).evaluate(facts));

    SECTION("k of n") {
        std::vector<std::unique_ptr<ICondition>> set;
        set.push_back(fact("rsi", ComparisonOp::GT, 70.0));
        set.push_back(fact("close", ComparisonOp::GT, 5.0));
        set.push_back(fact("breakout", ComparisonOp::EQ, 1.0));
        set.push_back(fact("ema_9", ComparisonOp::GT, 100.0));
        AtLeastCondition three_of_four(3, std::move(set));

        REQUIRE(three_of_four.countSatisfied(facts) == 3);
        REQUIRE(three_of_four.evaluate(facts));

        auto weaker = facts;
        weaker.setFlag("breakout", false);
        REQUIRE(three_of_four.countSatisfied(weaker) == 2);
        REQUIRE_FALSE(three_of_four.evaluate(weaker));
    }

    SECTION("minimum must fit the set") {
        std::vector<std::unique_ptr<ICondition>> set;
        set.push_back(fact("rsi", ComparisonOp::GT, 70.0));
        REQUIRE_THROWS_AS(AtLeastCondition(2, std::move(set)), std::invalid_argument);
    }
}

TEST_CASE("Rules render their message from the snapshot", "[rule_engine]") {
    const auto facts = sampleFacts();

    Rule rule("overbought", fact("rsi", ComparisonOp::GT, 70.0), "RSI {rsi:.1f} with grade {grade}");
    auto message = rule.evaluate(facts);
    REQUIRE(message.has_value());
    REQUIRE(*message == "RSI 72.5 with grade A");

    Rule quiet("oversold", fact("rsi", ComparisonOp::LT, 30.0), "oversold");
    REQUIRE_FALSE(quiet.evaluate(facts).has_value());

    SECTION("unknown template fields fall back to the raw template") {
        Rule broken("broken", fact("rsi", ComparisonOp::GT, 0.0), "value {missing}");
        REQUIRE(broken.evaluate(facts) == std::optional<std::string>("value {missing}"));
    }
}

TEST_CASE("Rule lists report one message per group", "[rule_engine]") {
    std::vector<std::unique_ptr<IRule>> rules;
    rules.push_back(std::make_unique<Rule>("extreme", fact("rsi", ComparisonOp::GT, 70.0), "extreme", "rsi"));
    rules.push_back(std::make_unique<Rule>("elevated", fact("rsi", ComparisonOp::GT, 60.0), "elevated", "rsi"));
    rules.push_back(std::make_unique<Rule>("breakout", fact("breakout", ComparisonOp::EQ, 1.0), "breakout"));
    RuleList list("tiers", std::move(rules));

    const auto messages = list.evaluate(sampleFacts());
    REQUIRE(messages == std::vector<std::string>{"extreme", "breakout"});

    auto calmer = sampleFacts();
    calmer.set("rsi", 65.0);
    REQUIRE(list.evaluate(calmer) == std::vector<std::string>{"elevated", "breakout"});
}

TEST_CASE("RuleFactory parses rule lists", "[rule_engine]") {
    const json config = R"({
        "name": "alerts",
        "rules": [
            {"name": "strong", "group": "score",
             "condition": {"type": "AND", "conditions": [
                 {"type": "Fact", "fact": "rsi", "op": ">", "value": 70},
                 {"type": "Fact", "fact": "close", "op": ">", "fact2": "ema_9"}]},
             "message": "strong"},
            {"name": "graded",
             "condition": {"type": "Label", "label": "grade", "in": ["A+", "A"]},
             "message": "grade {grade}"},
            {"name": "two_of_three",
             "condition": {"type": "AtLeast", "min": 2, "conditions": [
                 {"type": "Fact", "fact": "breakout", "op": "==", "value": 1},
                 {"type": "Fact", "fact": "rsi", "op": "<", "value": 30},
                 {"type": "OR", "conditions": [{"type": "Fact", "fact": "close", "op": ">=", "value": 10}]}]},
             "message": "confirmed"}
        ]
    })"_json;

    auto list = RuleFactory::createRuleList(config);
    REQUIRE(list != nullptr);
    REQUIRE(list->getName() == "alerts");
    REQUIRE(list->size() == 3);
    REQUIRE(list->evaluate(sampleFacts()) == std::vector<std::string>{"strong", "grade A", "confirmed"});
}

TEST_CASE("RuleFactory rejects malformed input", "[rule_engine]") {
    SECTION("not an object") {
        REQUIRE(RuleFactory::createRuleList(json::array()) == nullptr);
    }
    SECTION("missing rules") {
        REQUIRE(RuleFactory::createRuleList(json{{"name", "x"}}) == nullptr);
    }
    SECTION("unknown condition type") {
        const json config = R"({"name": "x", "rules": [
            {"name": "r", "condition": {"type": "XOR"}, "message": "m"}]})"_json;
        REQUIRE(RuleFactory::createRuleList(config) == nullptr);
    }
    SECTION("unknown operator") {
        const json config = R"({"name": "x", "rules": [
            {"name": "r", "condition": {"type": "Fact", "fact": "a", "op": "~", "value": 1}, "message": "m"}]})"_json;
        REQUIRE(RuleFactory::createRuleList(config) == nullptr);
    }
    SECTION("AtLeast without a minimum") {
        const json config = R"({"name": "x", "rules": [
            {"name": "r", "condition": {"type": "AtLeast", "conditions": [
                {"type": "Fact", "fact": "a", "op": ">", "value": 1}]}, "message": "m"}]})"_json;
        REQUIRE(RuleFactory::createRuleList(config) == nullptr);
    }
    SECTION("direct condition parsing throws") {
        REQUIRE_THROWS_AS(RuleFactory::parseCondition(json{{"type", "Fact"}}), std::invalid_argument);
    }
}
