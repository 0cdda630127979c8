#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>
#include "kernel/ActionTypes.h"

enum class ActorKind : std::uint8_t { User, Page };
enum class Lifecycle : std::uint8_t { Active, Churned };

const char* actorKindName(ActorKind kind);

// ---------- Profile ----------
struct ActorProfile {
    std::string name;
    std::string email;
    int age = 30;
    std::string gender;
    std::string nationality;
    std::string language = "english";
    std::string leaning;                 // political leaning
    std::string education;
    std::string toxicity = "no";
    std::vector<std::string> interests;
    std::string feedUrl;                 // pages only
};

// ---------- Actor Record ----------
struct ActorRecord {
    // Identity
    ActorId id = 0;
    ActorKind kind = ActorKind::User;
    ActorProfile profile;
    std::int64_t serviceId = -1;         // assigned by the content service on registration
    std::uint32_t createdOnDay = 0;

    // Lifecycle (written only at day boundaries)
    Lifecycle lifecycle = Lifecycle::Active;
    std::int64_t churnedOnSlot = -1;

    // Behaviour
    double activityAffinity = 1.0;       // multiplier on the hourly activity fraction
    bool hasPersonalWeights = false;
    ActionWeights actionWeights{};       // used only when hasPersonalWeights
    std::uint32_t roundActions = 1;      // daily action bound
    bool requiresLlm = true;             // any enabled action needs the language backend

    // Execution state (written only by this actor's own action)
    std::int64_t lastActiveSlot = -1;
    std::int64_t lastCastDay = -1;
    std::deque<std::int64_t> pendingMentions;  // post ids awaiting a reply
    std::vector<std::string> recentInterests;
    std::map<std::string, double> opinions;     // topic -> stance in [-1, 1]

    bool live() const { return lifecycle == Lifecycle::Active; }
    bool isPage() const { return kind == ActorKind::Page; }
};
