#ifndef LANGUAGE_BACKEND_H
#define LANGUAGE_BACKEND_H

#include <string>

// What the completion will be used for; offline backends answer by purpose.
enum class PromptPurpose { Post, Comment, Share, Reply, React, Cast, News, Emotions };

struct CompletionRequest {
    PromptPurpose purpose = PromptPurpose::Post;
    std::string system;       // persona / role instructions
    std::string prompt;
    double temperature = 0.7;
    int maxTokens = 256;
};

// Generative-language backend. Must be callable from several threads at once.
class LanguageBackend {
public:
    virtual ~LanguageBackend() = default;

    // Throws GatewayError on timeout, transport failure or a malformed reply.
    virtual std::string complete(const CompletionRequest& request) = 0;
    virtual const char* name() const = 0;
};

#endif
