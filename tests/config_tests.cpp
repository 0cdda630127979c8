#include <gtest/gtest.h>
#include <string>
#include "io/ConfigLoader.h"

namespace {

const char* kValid = R"({
  "servers": {"api": "http://10.0.0.2:5010/", "llm": "http://10.0.0.3:8000/v1", "llm_model": "mistral"},
  "simulation": {
    "name": "election",
    "days": 3,
    "slots": 4,
    "starting_agents": 20,
    "starting_pages": 1,
    "hourly_activity": {"0": 0.5, "1": 0.25, "2": 0.1, "3": 0.0},
    "actions_likelihood": {"post": 0.2, "comment_on_post": 0.3, "read": 0.4, "none": 0.1},
    "percentage_removed_agents_iteration": 0.05,
    "new_agents_iteration": 2,
    "seed": 7,
    "follow_recsys": "random"
  },
  "agents": {
    "probability_of_daily_follow": 0.2,
    "round_actions": {"min": 1, "max": 4},
    "age": {"min": 20, "max": 40},
    "political_leanings": ["left", "right"]
  },
  "posts": {"visibility_rounds": 12, "emotions": ["joy", "anger"]},
  "resources": {"heavy_capacity": 1.0, "heavy_unit": 0.25, "cpu_workers": 6, "light_retries": 1}
})";

// Parses a document built from kValid with one substitution applied
SimConfig parseWith(const std::string& from, const std::string& to) {
    std::string text = kValid;
    const auto pos = text.find(from);
    if (pos == std::string::npos) throw std::logic_error("fixture has no '" + from + "'");
    text.replace(pos, from.size(), to);
    return parseConfigText(text);
}

}  // namespace

TEST(ConfigTest, ParsesFullDocument) {
    SimConfig cfg = parseConfigText(kValid);
    EXPECT_EQ(cfg.name, "election");
    EXPECT_EQ(cfg.days, 3u);
    EXPECT_EQ(cfg.slotsPerDay, 4u);
    EXPECT_EQ(cfg.startingAgents, 20u);
    EXPECT_EQ(cfg.servers.apiUrl, "http://10.0.0.2:5010/");
    EXPECT_EQ(cfg.servers.llmModel, "mistral");
    EXPECT_EQ(cfg.seed, 7u);
    EXPECT_EQ(cfg.dispatch.seed, 7u);

    EXPECT_DOUBLE_EQ(cfg.hourlyActivity.fraction(1), 0.25);
    EXPECT_EQ(cfg.hourlyActivity.size(), 4u);
    EXPECT_DOUBLE_EQ(cfg.actionWeights[actionIndex(ActionKind::Comment)], 0.3);
    EXPECT_DOUBLE_EQ(cfg.actionWeights[actionIndex(ActionKind::Share)], 0.0);
    EXPECT_DOUBLE_EQ(cfg.noopWeight, 0.1);

    EXPECT_EQ(cfg.population.churn.mode, RateMode::Percentage);
    EXPECT_DOUBLE_EQ(cfg.population.churn.value, 0.05);
    EXPECT_EQ(cfg.population.recruitment.mode, RateMode::Fixed);
    EXPECT_EQ(cfg.population.recruitment.countFor(100), 2u);

    EXPECT_EQ(cfg.profiles.maxRoundActions, 4u);
    EXPECT_EQ(cfg.profiles.minAge, 20);
    EXPECT_EQ(cfg.handlers.castOptions, (std::vector<std::string>{"left", "right"}));
    EXPECT_EQ(cfg.visibilityRounds, 12);
    EXPECT_EQ(heavyConcurrency(cfg.dispatch), 4u);
    EXPECT_EQ(cfg.dispatch.cpuWorkers, 6u);
}

// Absent optional sections keep their defaults
TEST(ConfigTest, MinimalDocument) {
    SimConfig cfg = parseConfigText(R"({"simulation": {"hourly_activity": {"0": 1.0}}})");
    EXPECT_EQ(cfg.days, 1u);
    EXPECT_EQ(cfg.slotsPerDay, 24u);
    EXPECT_EQ(cfg.population.churn.countFor(100), 0u);
    EXPECT_TRUE(cfg.dispatch.parallel);
}

TEST(ConfigTest, RejectsMissingOrBadHourlyTable) {
    EXPECT_THROW(parseConfigText(R"({"simulation": {"days": 1}})"), ConfigError);
    EXPECT_THROW(parseWith(R"("3": 0.0)", R"("4": 0.0)"), ConfigError);      // beyond the day
    EXPECT_THROW(parseWith(R"("3": 0.0)", R"("3a": 0.0)"), ConfigError);     // not an hour
    EXPECT_THROW(parseWith(R"("2": 0.1)", R"("2": 1.5)"), ConfigError);      // not a fraction
}

TEST(ConfigTest, RejectsBadRates) {
    // Both forms of the same rate
    EXPECT_THROW(parseWith(R"("new_agents_iteration": 2)",
                           R"("new_agents_iteration": 2, "percentage_new_agents_iteration": 0.1)"),
                 ConfigError);
    EXPECT_THROW(parseWith("0.05", "1.2"), ConfigError);
    EXPECT_THROW(parseWith(R"("new_agents_iteration": 2)", R"("new_agents_iteration": -2)"),
                 ConfigError);
}

TEST(ConfigTest, RejectsBadWeights) {
    EXPECT_THROW(parseWith(R"("post": 0.2)", R"("post": -0.2)"), ConfigError);
    EXPECT_THROW(parseWith(R"("post": 0.2)", R"("dance": 0.2)"), ConfigError);
}

// An image weight is tolerated and has no effect on the action mix
TEST(ConfigTest, IgnoresImageWeight) {
    const SimConfig base = parseConfigText(kValid);
    const SimConfig cfg = parseWith(R"("post": 0.2)", R"("post": 0.2, "IMAGE": 0.3)");
    EXPECT_EQ(cfg.actionWeights, base.actionWeights);
    EXPECT_EQ(cfg.noopWeight, base.noopWeight);
}

TEST(ConfigTest, OpinionDynamics) {
    const std::string leanings = R"("political_leanings": ["left", "right"])";
    const SimConfig cfg = parseWith(
        leanings, leanings + R"(, "opinion_dynamics": {"enabled": true, "epsilon": 0.3,
                                 "mu": 0.2, "theta": 0.05, "cold_start": "Inherited"})");
    const OpinionConfig& op = cfg.handlers.opinions;
    EXPECT_TRUE(op.enabled);
    EXPECT_DOUBLE_EQ(op.epsilon, 0.3);
    EXPECT_DOUBLE_EQ(op.mu, 0.2);
    EXPECT_DOUBLE_EQ(op.theta, 0.05);
    EXPECT_EQ(op.coldStart, ColdStart::Inherited);
    EXPECT_FALSE(parseConfigText(kValid).handlers.opinions.enabled);

    EXPECT_THROW(parseWith(leanings, leanings + R"(, "opinion_dynamics": {"mu": 1.5})"),
                 ConfigError);
    EXPECT_THROW(parseWith(leanings, leanings + R"(, "opinion_dynamics": {"cold_start": "x"})"),
                 ConfigError);
    EXPECT_THROW(parseWith(leanings, leanings + R"(, "opinion_dynamics": true)"), ConfigError);
}

TEST(ConfigTest, RejectsBadStructure) {
    EXPECT_THROW(parseWith(R"("slots": 4)", R"("slots": 0)"), ConfigError);
    EXPECT_THROW(parseWith(R"("days": 3)", R"("days": 0)"), ConfigError);
    EXPECT_THROW(parseWith(R"("days": 3)", R"("days": "three")"), ConfigError);
    EXPECT_THROW(parseWith(R"({"min": 1, "max": 4})", R"({"min": 5, "max": 4})"), ConfigError);
    EXPECT_THROW(parseWith(R"("heavy_unit": 0.25)", R"("heavy_unit": 2.0)"), ConfigError);
    EXPECT_THROW(parseWith(R"("follow_recsys": "random")", R"("follow_recsys": "magic")"),
                 ConfigError);
    EXPECT_THROW(parseConfigText("{ not json"), ConfigError);
}

TEST(ConfigTest, MissingFileNamesPath) {
    try {
        loadConfig("/nonexistent/agora.json");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/agora.json"), std::string::npos);
    }
}
