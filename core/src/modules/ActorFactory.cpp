#include "modules/ActorFactory.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

const std::string& pick(const std::vector<std::string>& pool, std::mt19937_64& rng) {
    static const std::string kEmpty;
    if (pool.empty()) return kEmpty;
    std::uniform_int_distribution<std::size_t> d(0, pool.size() - 1);
    return pool[d(rng)];
}

}  // namespace

ActorFactory::ActorFactory(ProfileConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.minAge > cfg_.maxAge) {
        throw std::invalid_argument("age.min must be <= age.max (got " + std::to_string(cfg_.minAge) +
                                    " > " + std::to_string(cfg_.maxAge) + ")");
    }
    if (cfg_.minInterests > cfg_.maxInterests) {
        throw std::invalid_argument("n_interests.min must be <= n_interests.max");
    }
    if (cfg_.minRoundActions > cfg_.maxRoundActions) {
        throw std::invalid_argument("round_actions.min must be <= round_actions.max");
    }
    if (cfg_.activityVariance < 0.0) {
        throw std::invalid_argument("activityVariance must be >= 0 (got " +
                                    std::to_string(cfg_.activityVariance) + ")");
    }
}

ActorRecord ActorFactory::makeUser(ActorId id, std::uint32_t day, std::mt19937_64& rng) const {
    ActorRecord a;
    a.id = id;
    a.kind = ActorKind::User;
    a.createdOnDay = day;
    a.requiresLlm = cfg_.llmActors;

    // Identity
    ActorProfile& p = a.profile;
    p.name = cfg_.namePrefix + "_" + std::to_string(id);
    p.email = p.name + "@" + cfg_.emailDomain;
    std::uniform_int_distribution<int> age(cfg_.minAge, cfg_.maxAge);
    p.age = age(rng);
    p.gender = pick(cfg_.genders, rng);
    p.nationality = pick(cfg_.nationalities, rng);
    p.language = pick(cfg_.languages, rng);
    p.leaning = pick(cfg_.leanings, rng);
    p.education = pick(cfg_.educationLevels, rng);
    p.toxicity = pick(cfg_.toxicityLevels, rng);

    // Interests, without replacement
    std::vector<std::string> pool = cfg_.interests;
    std::shuffle(pool.begin(), pool.end(), rng);
    const std::uint32_t hi = std::min<std::uint32_t>(cfg_.maxInterests,
                                                     static_cast<std::uint32_t>(pool.size()));
    const std::uint32_t lo = std::min(cfg_.minInterests, hi);
    std::uniform_int_distribution<std::uint32_t> nInterests(lo, hi);
    pool.resize(nInterests(rng));
    p.interests = std::move(pool);

    // Behaviour
    std::uniform_int_distribution<std::uint32_t> rounds(cfg_.minRoundActions, cfg_.maxRoundActions);
    a.roundActions = rounds(rng);
    if (cfg_.activityVariance > 0.0) {
        std::normal_distribution<double> affinity(1.0, cfg_.activityVariance);
        a.activityAffinity = std::clamp(affinity(rng), 0.0, 2.0);
    }
    return a;
}

ActorRecord ActorFactory::makePage(ActorId id, const PageSpec& spec, std::uint32_t day) const {
    ActorRecord a;
    a.id = id;
    a.kind = ActorKind::Page;
    a.createdOnDay = day;
    a.requiresLlm = cfg_.llmActors;
    a.roundActions = 1;

    ActorProfile& p = a.profile;
    p.name = spec.name;
    p.email = spec.name + "@" + cfg_.emailDomain;
    p.feedUrl = spec.feedUrl;
    p.leaning = spec.leaning;
    p.language = cfg_.languages.empty() ? "english" : cfg_.languages.front();
    return a;
}
