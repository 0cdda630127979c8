#include "modules/Prompts.h"
#include <sstream>
#include <utility>

namespace {

std::string joined(const std::vector<std::string>& items, const char* sep = ", ") {
    std::ostringstream os;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) os << sep;
        os << items[i];
    }
    return os.str();
}

std::string renderThread(const std::vector<PostView>& thread) {
    std::ostringstream os;
    for (const auto& post : thread) {
        if (!post.authorName.empty()) os << "@" << post.authorName << ": ";
        os << post.text << "\n";
    }
    return os.str();
}

CompletionRequest request(PromptPurpose purpose, const ActorRecord& actor, std::string prompt,
                          const GenerationParams& params) {
    CompletionRequest req;
    req.purpose = purpose;
    req.system = personaOf(actor);
    req.prompt = std::move(prompt);
    req.temperature = params.temperature;
    req.maxTokens = params.maxTokens;
    return req;
}

}  // namespace

std::string personaOf(const ActorRecord& actor) {
    const ActorProfile& p = actor.profile;
    std::ostringstream os;
    if (actor.isPage()) {
        os << "You are " << p.name << ", a news page on a social network. "
           << "You publish short posts about articles from your outlet. "
           << "Write in " << p.language << ".";
        return os.str();
    }
    os << "You are " << p.name << ", a " << p.age << " year old";
    if (!p.gender.empty()) os << " " << p.gender;
    if (!p.nationality.empty()) os << " from " << p.nationality;
    os << " using a social network. ";
    if (!p.leaning.empty()) os << "Politically you lean " << p.leaning << ". ";
    if (!p.education.empty()) os << "Your education level is " << p.education << ". ";
    if (!p.interests.empty()) os << "You care about " << joined(p.interests) << ". ";
    if (!actor.opinions.empty()) {
        os << "Your current opinions:";
        for (const auto& [topic, stance] : actor.opinions) {
            os << " " << topic << "=" << stance;
        }
        os << ". ";
    }
    os << "Toxicity: " << p.toxicity << ". Write in " << p.language
       << ". Keep it short, like a real post, no hashtags unless natural.";
    return os.str();
}

CompletionRequest postPrompt(const ActorRecord& actor, const std::vector<std::string>& topics,
                             const GenerationParams& params) {
    std::ostringstream os;
    os << "Write a new post";
    if (!topics.empty()) os << " about " << joined(topics, " and ");
    os << ". Answer with the post text only.";
    return request(PromptPurpose::Post, actor, os.str(), params);
}

CompletionRequest commentPrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                                const GenerationParams& params) {
    return request(PromptPurpose::Comment, actor,
                   "Here is a conversation:\n" + renderThread(thread) +
                       "Write a comment continuing it. Answer with the comment text only.",
                   params);
}

CompletionRequest replyPrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                              const GenerationParams& params) {
    return request(PromptPurpose::Reply, actor,
                   "You were mentioned in this conversation:\n" + renderThread(thread) +
                       "Reply to it. Answer with the reply text only.",
                   params);
}

CompletionRequest sharePrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                              const GenerationParams& params) {
    return request(PromptPurpose::Share, actor,
                   "You are sharing this post with your followers:\n" + renderThread(thread) +
                       "Write one sentence to go with it.",
                   params);
}

CompletionRequest reactPrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                              const GenerationParams& params) {
    return request(PromptPurpose::React, actor,
                   "Read this post:\n" + renderThread(thread) +
                       "Do you LIKE or DISLIKE it? Answer with exactly one word: LIKE, DISLIKE or NONE.",
                   params);
}

CompletionRequest castPrompt(const ActorRecord& actor, const std::vector<PostView>& thread,
                             const std::vector<std::string>& options, const GenerationParams& params) {
    return request(PromptPurpose::Cast, actor,
                   "Read this post:\n" + renderThread(thread) +
                       "Which side does it make you prefer? Answer with exactly one of: " +
                       joined(options) + ", NONE.",
                   params);
}

CompletionRequest newsPrompt(const ActorRecord& actor, const Article& article,
                             const GenerationParams& params) {
    std::ostringstream os;
    os << "Write a short post presenting this article.\n"
       << "Title: " << article.title << "\n"
       << "Summary: " << article.summary << "\n"
       << "Answer with the post text only.";
    return request(PromptPurpose::News, actor, os.str(), params);
}

CompletionRequest emotionPrompt(const std::string& text, const std::vector<std::string>& emotions,
                                const GenerationParams& params) {
    CompletionRequest req;
    req.purpose = PromptPurpose::Emotions;
    req.system = "You annotate the emotions expressed in short texts.";
    req.prompt = "Text: " + text + "\nWhich of these emotions does it express? " +
                 joined(emotions) + ". Answer with a comma separated list.";
    req.temperature = 0.0;
    req.maxTokens = params.maxTokens;
    return req;
}
