#ifndef ACTOR_FACTORY_H
#define ACTOR_FACTORY_H

#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "kernel/Actor.h"

// ---------- Profile Pools ----------
struct ProfileConfig {
    std::vector<std::string> interests = {"politics", "sports", "technology", "music",
                                          "movies", "science", "travel", "food"};
    std::uint32_t minInterests = 1;
    std::uint32_t maxInterests = 3;
    int minAge = 18;
    int maxAge = 65;
    std::vector<std::string> genders = {"male", "female", "non-binary"};
    std::vector<std::string> nationalities = {"American"};
    std::vector<std::string> leanings = {"democrat", "republican"};
    std::vector<std::string> languages = {"english"};
    std::vector<std::string> educationLevels = {"high school", "bachelor", "master"};
    std::vector<std::string> toxicityLevels = {"no"};
    std::uint32_t minRoundActions = 1;
    std::uint32_t maxRoundActions = 3;
    double activityVariance = 0.0;     // std dev of the activity affinity around 1
    bool llmActors = true;             // false: actors run without the language backend
    std::string namePrefix = "user";
    std::string emailDomain = "agora.sim";
};

struct PageSpec {
    std::string name;
    std::string feedUrl;
    std::string leaning;
};

/**
 * Draws profiles for the initial population and for recruits.
 * Deterministic given the caller's RNG.
 */
class ActorFactory {
public:
    explicit ActorFactory(ProfileConfig cfg);

    ActorRecord makeUser(ActorId id, std::uint32_t day, std::mt19937_64& rng) const;
    ActorRecord makePage(ActorId id, const PageSpec& spec, std::uint32_t day) const;

    const ProfileConfig& config() const { return cfg_; }

private:
    ProfileConfig cfg_;
};

#endif
