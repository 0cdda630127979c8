#ifndef ACTION_SELECTOR_H
#define ACTION_SELECTOR_H

#include <cstdint>
#include <optional>
#include <random>
#include "kernel/Actor.h"
#include "kernel/SimClock.h"

// Scales weights to sum to 1. All-zero (or negative) input yields all zeros.
ActionWeights normalizeWeights(const ActionWeights& weights);

/**
 * Picks at most one action for an active actor.
 *
 * Eligibility: positive weight, allowed for the actor kind (pages publish
 * only), CAST at most once per day, REPLY only with a pending mention.
 * The choice is a weighted draw over the eligible subset plus an optional
 * no-op weight. Returns nullopt for a no-op.
 */
class ActionSelector {
public:
    explicit ActionSelector(const ActionWeights& globalWeights, double noopWeight = 0.0);

    std::optional<ActionIntent> select(const ActorRecord& actor, const SlotInfo& slot,
                                       std::mt19937_64& rng) const;

    bool isEligible(const ActorRecord& actor, ActionKind kind, const SlotInfo& slot) const;
    const ActionWeights& weightsFor(const ActorRecord& actor) const;

    const ActionWeights& globalWeights() const { return global_; }
    double noopWeight() const { return noopWeight_; }

private:
    ActionWeights global_;
    double noopWeight_;
};

#endif
