#include "kernel/ActionTypes.h"
#include <algorithm>
#include <cctype>
#include <utility>

namespace {

// Method names carried over from the agent interface, kept so old configs
// and telemetry tooling keep parsing.
const std::pair<const char*, ActionKind> kAliases[] = {
    {"post_content", ActionKind::Post},
    {"comment_on_post", ActionKind::Comment},
    {"read_posts", ActionKind::Read},
    {"share_post", ActionKind::Share},
    {"reply_to_mentions", ActionKind::Reply},
    {"search_posts", ActionKind::Search},
    {"follow_action", ActionKind::Follow},
    {"cast_vote", ActionKind::Cast},
    {"reaction_to_post", ActionKind::React},
    {"reaction", ActionKind::React},
    {"publish_news", ActionKind::News},
};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

const char* actionName(ActionKind kind) {
    if (kind == ActionKind::COUNT) return "invalid";
    return traitsOf(kind).name;
}

std::optional<ActionKind> parseActionKind(const std::string& name) {
    const std::string key = lowercase(name);
    for (std::size_t i = 0; i < kActionKindCount; ++i) {
        if (key == kActionTraits[i].name) {
            return static_cast<ActionKind>(i);
        }
    }
    for (const auto& [alias, kind] : kAliases) {
        if (key == alias) return kind;
    }
    return std::nullopt;
}

const char* statusName(ActionStatus status) {
    switch (status) {
        case ActionStatus::Succeeded: return "succeeded";
        case ActionStatus::Failed: return "failed";
        case ActionStatus::Skipped: return "skipped";
    }
    return "unknown";
}

const char* causeName(FailureCause cause) {
    switch (cause) {
        case FailureCause::None: return "none";
        case FailureCause::Timeout: return "timeout";
        case FailureCause::Transport: return "transport";
        case FailureCause::ServerError: return "server_error";
        case FailureCause::ClientError: return "client_error";
        case FailureCause::MalformedResponse: return "malformed_response";
        case FailureCause::Internal: return "internal";
        case FailureCause::QueueFull: return "queue_full";
    }
    return "unknown";
}
