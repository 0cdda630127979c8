#ifndef PROMPTS_H
#define PROMPTS_H

#include <string>
#include <vector>
#include "kernel/Actor.h"
#include "net/ContentService.h"
#include "net/LanguageBackend.h"

struct GenerationParams {
    double temperature = 0.7;
    int maxTokens = 256;
};

// Role-play description of the actor, used as the system message.
std::string personaOf(const ActorRecord& actor);

CompletionRequest postPrompt(const ActorRecord& actor, const std::vector<std::string>& topics,
                             const GenerationParams& params);
CompletionRequest commentPrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                                const GenerationParams& params);
CompletionRequest replyPrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                              const GenerationParams& params);
CompletionRequest sharePrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                              const GenerationParams& params);
CompletionRequest reactPrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                              const GenerationParams& params);
CompletionRequest castPrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                             const std::vector<std::string>& options, const GenerationParams& params);
CompletionRequest newsPrompt(const ActorRecord& actor, const Article& article,
                             const GenerationParams& params);
CompletionRequest emotionPrompt(const std::string& text, const std::vector<std::string>& emotions,
                                const GenerationParams& params);

#endif
