#include "modules/OpinionDynamics.h"
#include <algorithm>
#include <cmath>

double boundedConfidence(std::optional<double> x, double y, const OpinionConfig& cfg) {
    y = std::clamp(y, -1.0, 1.0);
    if (!x) {
        return cfg.coldStart == ColdStart::Inherited ? y : 0.0;
    }

    double stance = *x;
    if (std::abs(y - stance) <= cfg.epsilon) {
        stance += cfg.mu * (y - stance);
    } else if (cfg.theta > 0.0) {
        stance += stance > y ? cfg.theta : -cfg.theta;
    }
    return std::clamp(stance, -1.0, 1.0);
}

void updateOpinions(std::map<std::string, double>& opinions,
                    const std::map<std::string, double>& met, const OpinionConfig& cfg) {
    for (const auto& [topic, theirs] : met) {
        auto it = opinions.find(topic);
        const std::optional<double> mine =
            it == opinions.end() ? std::nullopt : std::optional<double>(it->second);
        opinions[topic] = boundedConfidence(mine, theirs, cfg);
    }
}

std::optional<ColdStart> parseColdStart(const std::string& name) {
    if (name == "neutral") return ColdStart::Neutral;
    if (name == "inherited") return ColdStart::Inherited;
    return std::nullopt;
}
