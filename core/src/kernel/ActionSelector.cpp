#include "kernel/ActionSelector.h"
#include <stdexcept>
#include <string>

ActionWeights normalizeWeights(const ActionWeights& weights) {
    double total = 0.0;
    for (double w : weights) {
        if (w > 0.0) total += w;
    }
    ActionWeights out{};
    if (total <= 0.0) return out;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        out[i] = weights[i] > 0.0 ? weights[i] / total : 0.0;
    }
    return out;
}

ActionSelector::ActionSelector(const ActionWeights& globalWeights, double noopWeight)
    : global_(globalWeights), noopWeight_(noopWeight) {
    for (std::size_t i = 0; i < global_.size(); ++i) {
        if (global_[i] < 0.0) {
            throw std::invalid_argument(std::string("weight for ") +
                                        kActionTraits[i].name + " must be >= 0 (got " +
                                        std::to_string(global_[i]) + ")");
        }
    }
    if (noopWeight_ < 0.0) {
        throw std::invalid_argument("noopWeight must be >= 0 (got " +
                                    std::to_string(noopWeight_) + ")");
    }
}

const ActionWeights& ActionSelector::weightsFor(const ActorRecord& actor) const {
    return actor.hasPersonalWeights ? actor.actionWeights : global_;
}

bool ActionSelector::isEligible(const ActorRecord& actor, ActionKind kind,
                                const SlotInfo& slot) const {
    if (!(weightsFor(actor)[actionIndex(kind)] > 0.0)) return false;

    const ActionTraits& t = traitsOf(kind);
    if (actor.isPage() ? !t.pageEligible : !t.userEligible) return false;

    switch (kind) {
        case ActionKind::Cast:
            return actor.lastCastDay != static_cast<std::int64_t>(slot.day);
        case ActionKind::Reply:
            return !actor.pendingMentions.empty();
        default:
            return true;
    }
}

std::optional<ActionIntent> ActionSelector::select(const ActorRecord& actor, const SlotInfo& slot,
                                                   std::mt19937_64& rng) const {
    const ActionWeights& weights = weightsFor(actor);

    ActionWeights eligible{};
    double total = 0.0;
    for (std::size_t i = 0; i < kActionKindCount; ++i) {
        const auto kind = static_cast<ActionKind>(i);
        if (isEligible(actor, kind, slot)) {
            eligible[i] = weights[i];
            total += weights[i];
        }
    }
    if (total <= 0.0) return std::nullopt;

    // Cumulative walk over eligible kinds, with the no-op mass at the end
    std::uniform_real_distribution<double> U(0.0, total + noopWeight_);
    double r = U(rng);
    if (r >= total) return std::nullopt;

    std::size_t chosen = kActionKindCount;
    for (std::size_t i = 0; i < kActionKindCount; ++i) {
        if (eligible[i] <= 0.0) continue;
        chosen = i;
        if (r < eligible[i]) break;
        r -= eligible[i];
    }

    ActionIntent intent;
    intent.actor = actor.id;
    intent.slot = slot.slot;
    intent.kind = static_cast<ActionKind>(chosen);
    if (intent.kind == ActionKind::Reply) {
        intent.target = actor.pendingMentions.front();
    }
    return intent;
}
