#ifndef OPINION_DYNAMICS_H
#define OPINION_DYNAMICS_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Stance of an actor with no opinion yet on a topic it meets.
enum class ColdStart : std::uint8_t { Neutral, Inherited };

// Bounded-confidence model on stances in [-1, 1].
struct OpinionConfig {
    bool enabled = false;        // fetch sentiment and update opinions on interaction
    double epsilon = 0.5;        // confidence bound; wider gaps do not persuade
    double mu = 0.5;             // convergence rate inside the bound
    double theta = 0.0;          // backfire step outside the bound, 0 disables
    ColdStart coldStart = ColdStart::Neutral;
};

/**
 * New stance of an actor holding x after meeting stance y.
 *
 * No prior stance: 0 (Neutral) or y (Inherited). Within epsilon the actor
 * moves mu of the way towards y; beyond it the stance is kept, or pushed
 * theta away from y when theta > 0. The result stays in [-1, 1].
 */
double boundedConfidence(std::optional<double> x, double y, const OpinionConfig& cfg);

// Applies boundedConfidence for every topic in `met`.
void updateOpinions(std::map<std::string, double>& opinions,
                    const std::map<std::string, double>& met, const OpinionConfig& cfg);

std::optional<ColdStart> parseColdStart(const std::string& name);

#endif
