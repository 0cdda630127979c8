#ifndef ACTION_HANDLERS_H
#define ACTION_HANDLERS_H

#include <array>
#include <cstddef>
#include <random>
#include <string>
#include <vector>
#include "kernel/ActorPopulation.h"
#include "kernel/FollowGraph.h"
#include "kernel/SimClock.h"
#include "modules/OpinionDynamics.h"
#include "modules/Prompts.h"
#include "net/ContentService.h"
#include "net/LanguageBackend.h"
#include "net/RecommenderGateway.h"

// Non-owning handles to the external collaborators.
struct ActionServices {
    ContentService* content = nullptr;
    LanguageBackend* language = nullptr;
    RecommenderGateway* recommender = nullptr;
};

struct HandlerSettings {
    std::size_t feedSize = 10;           // posts requested from the content recommender
    std::size_t maxThreadLength = 5;     // posts of context read before writing
    std::size_t followCandidates = 10;   // suggestions requested per follow action
    bool annotateEmotions = false;       // extra language call per post
    std::vector<std::string> emotions;
    std::vector<std::string> castOptions;
    GenerationParams generation;
    OpinionConfig opinions;
};

/**
 * Everything a handler may touch besides its own actor. Population and
 * graph are read-only during a slot; follow edges are returned through
 * result.follows and applied once the slot drains.
 */
struct ActionContext {
    const ActionServices& services;
    const HandlerSettings& settings;
    const ActorPopulation& population;
    const FollowGraph& graph;
    SlotInfo slot;
    std::mt19937_64& rng;   // per-intent stream
    ActionResult& result;
};

// Handlers throw GatewayError (or std::exception) on failure; the dispatcher
// turns that into a failed ActionResult.
using ActionHandler = void (*)(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);

void handlePost(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleComment(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleRead(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleShare(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleReply(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleSearch(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleFollow(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleCast(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleReact(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);
void handleNews(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx);

// Indexed by ActionKind
inline constexpr std::array<ActionHandler, kActionKindCount> kActionHandlers = {{
    &handlePost,
    &handleComment,
    &handleRead,
    &handleShare,
    &handleReply,
    &handleSearch,
    &handleFollow,
    &handleCast,
    &handleReact,
    &handleNews,
}};
static_assert(kActionHandlers[kActionKindCount - 1] != nullptr, "one handler per ActionKind");

inline void runAction(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    kActionHandlers[actionIndex(intent.kind)](actor, intent, ctx);
}

#endif
