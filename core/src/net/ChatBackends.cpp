#include "net/ChatBackends.h"
#include "net/GatewayError.h"
#include <functional>
#include <utility>

OpenAiChatBackend::OpenAiChatBackend(const HttpClient& client, std::string model)
    : http_(client), model_(std::move(model)) {}

std::string OpenAiChatBackend::complete(const CompletionRequest& request) {
    Json::Value body;
    body["model"] = model_;
    body["temperature"] = request.temperature;
    body["max_tokens"] = request.maxTokens;

    Json::Value messages(Json::arrayValue);
    if (!request.system.empty()) {
        Json::Value sys;
        sys["role"] = "system";
        sys["content"] = request.system;
        messages.append(sys);
    }
    Json::Value user;
    user["role"] = "user";
    user["content"] = request.prompt;
    messages.append(user);
    body["messages"] = messages;

    const Json::Value reply = http_.postJson("/chat/completions", body);
    const Json::Value& choices = reply["choices"];
    if (!choices.isArray() || choices.empty()) {
        throw GatewayError(GatewayError::Kind::Malformed, "completion reply has no choices");
    }
    const Json::Value& content = choices[0]["message"]["content"];
    if (!content.isString()) {
        throw GatewayError(GatewayError::Kind::Malformed, "completion reply has no message content");
    }
    return content.asString();
}

TemplateBackend::TemplateBackend(std::vector<std::string> castOptions,
                                 std::vector<std::string> emotions)
    : castOptions_(std::move(castOptions)), emotions_(std::move(emotions)) {}

std::string TemplateBackend::complete(const CompletionRequest& request) {
    static const char* kSentences[] = {
        "Just read something that changed my mind today.",
        "Hard to believe how fast things move these days.",
        "Anyone else following this story?",
        "Good people, good conversations. That is all I ask.",
        "Not sure I agree, but it is worth thinking about.",
        "This deserves more attention than it is getting.",
    };
    constexpr std::size_t kSentenceCount = sizeof(kSentences) / sizeof(kSentences[0]);

    // Same request, same answer, whatever order the workers call in
    const std::uint64_t n = std::hash<std::string>{}(request.system + '\n' + request.prompt);
    switch (request.purpose) {
        case PromptPurpose::React:
            return (n % 3 == 2) ? "DISLIKE" : "LIKE";
        case PromptPurpose::Cast:
            if (castOptions_.empty()) return "NONE";
            return castOptions_[n % castOptions_.size()];
        case PromptPurpose::Emotions:
            if (emotions_.empty()) return "";
            return emotions_[n % emotions_.size()];
        default:
            return kSentences[n % kSentenceCount];
    }
}
