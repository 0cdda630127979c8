#ifndef ACTION_TYPES_H
#define ACTION_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using ActorId = std::uint32_t;

// ---------- Action Vocabulary ----------
enum class ActionKind : std::uint8_t {
    Post = 0,
    Comment,
    Read,
    Share,
    Reply,
    Search,
    Follow,
    Cast,
    React,
    News,
    COUNT
};

constexpr std::size_t kActionKindCount = static_cast<std::size_t>(ActionKind::COUNT);

// Light actions only touch the content service; heavy ones need the language backend.
enum class ResourceClass : std::uint8_t { Light, Heavy };

struct ActionTraits {
    const char* name;
    ResourceClass resource;
    bool pageEligible;   // pages may only pick these
    bool userEligible;
    bool idempotent;     // safe to retry inside the slot
};

constexpr std::array<ActionTraits, kActionKindCount> kActionTraits = {{
    {"post",    ResourceClass::Heavy, true,  true,  false},
    {"comment", ResourceClass::Heavy, false, true,  false},
    {"read",    ResourceClass::Light, false, true,  true},
    {"share",   ResourceClass::Heavy, false, true,  false},
    {"reply",   ResourceClass::Heavy, false, true,  false},
    {"search",  ResourceClass::Light, false, true,  true},
    {"follow",  ResourceClass::Light, false, true,  true},
    {"cast",    ResourceClass::Heavy, false, true,  false},
    {"react",   ResourceClass::Heavy, false, true,  false},
    {"news",    ResourceClass::Heavy, true,  true,  false},
}};

constexpr std::size_t actionIndex(ActionKind kind) {
    return static_cast<std::size_t>(kind);
}

constexpr const ActionTraits& traitsOf(ActionKind kind) {
    return kActionTraits[actionIndex(kind)];
}

constexpr bool isHeavy(ActionKind kind) {
    return traitsOf(kind).resource == ResourceClass::Heavy;
}

// Relative likelihood per kind; need not sum to 1.
using ActionWeights = std::array<double, kActionKindCount>;

const char* actionName(ActionKind kind);

// Case-insensitive; accepts the method-style aliases used in telemetry
// ("post_content", "comment_on_post", ...). Returns nullopt for unknown names.
std::optional<ActionKind> parseActionKind(const std::string& name);

// ---------- Intents & Results ----------
struct ActionIntent {
    ActorId actor = 0;
    std::uint64_t slot = 0;
    ActionKind kind = ActionKind::Read;
    std::optional<std::int64_t> target;  // post id for REPLY, otherwise chosen by the handler
};

enum class ActionStatus : std::uint8_t { Succeeded, Failed, Skipped };

enum class FailureCause : std::uint8_t {
    None,
    Timeout,
    Transport,
    ServerError,
    ClientError,
    MalformedResponse,
    Internal,
    QueueFull
};

const char* statusName(ActionStatus status);
const char* causeName(FailureCause cause);

struct FollowEdge {
    ActorId follower = 0;
    ActorId followee = 0;
};

struct ActionResult {
    ActorId actor = 0;
    std::uint64_t slot = 0;
    ActionKind kind = ActionKind::Read;
    ActionStatus status = ActionStatus::Succeeded;
    FailureCause cause = FailureCause::None;
    std::string error;
    double durationMs = 0.0;
    int attempts = 0;

    std::vector<FollowEdge> follows;     // applied to the graph after the slot drains
    std::optional<std::int64_t> postId;  // content created by this action
    std::vector<std::int64_t> mentions;  // mentions discovered while reading

    bool ok() const { return status == ActionStatus::Succeeded; }
};

#endif
