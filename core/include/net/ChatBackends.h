#ifndef CHAT_BACKENDS_H
#define CHAT_BACKENDS_H

#include <cstdint>
#include <string>
#include <vector>
#include "net/HttpClient.h"
#include "net/LanguageBackend.h"

// OpenAI-compatible /chat/completions endpoint (vLLM, Ollama, llama.cpp server, ...).
class OpenAiChatBackend : public LanguageBackend {
public:
    OpenAiChatBackend(const HttpClient& client, std::string model);

    std::string complete(const CompletionRequest& request) override;
    const char* name() const override { return "openai-chat"; }

private:
    HttpClient http_;
    std::string model_;
};

/**
 * Offline backend: no model, canned text picked by hashing the request.
 * Reactions, votes and emotion labels come out as parseable tokens.
 */
class TemplateBackend : public LanguageBackend {
public:
    explicit TemplateBackend(std::vector<std::string> castOptions = {},
                             std::vector<std::string> emotions = {});

    std::string complete(const CompletionRequest& request) override;
    const char* name() const override { return "template"; }

private:
    std::vector<std::string> castOptions_;
    std::vector<std::string> emotions_;
};

#endif
