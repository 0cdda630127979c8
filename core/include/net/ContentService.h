#ifndef CONTENT_SERVICE_H
#define CONTENT_SERVICE_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "kernel/Actor.h"

// ---------- Wire Types ----------
struct PostDraft {
    std::string text;
    std::vector<std::string> hashtags;
    std::vector<std::string> mentions;
    std::vector<std::string> emotions;
};

struct PostView {
    std::int64_t id = -1;
    std::int64_t author = -1;   // service id
    std::string authorName;
    std::string text;
};

struct Article {
    std::int64_t id = -1;
    std::string title;
    std::string summary;
    std::string link;
    std::string publisher;
};

enum class Reaction { Like, Dislike };

/**
 * Remote content/graph service. Ids in this interface are service ids
 * (ActorRecord::serviceId), never ActorIds. Implementations carry the
 * per-call timeout and report failures as GatewayError. Calls may arrive
 * concurrently from several workers.
 */
class ContentService {
public:
    virtual ~ContentService() = default;

    // Returns the service id assigned to the new account.
    virtual std::int64_t registerActor(const ActorRecord& actor, std::uint32_t day) = 0;

    virtual std::int64_t publishPost(std::int64_t author, const PostDraft& draft, std::uint64_t tid) = 0;
    virtual std::int64_t comment(std::int64_t author, std::int64_t postId, const PostDraft& draft,
                                 std::uint64_t tid) = 0;
    virtual std::int64_t share(std::int64_t author, std::int64_t postId, const std::string& note,
                               std::uint64_t tid) = 0;
    virtual void react(std::int64_t author, std::int64_t postId, Reaction reaction, std::uint64_t tid) = 0;
    virtual void castPreference(std::int64_t author, std::int64_t postId, const std::string& choice,
                                std::uint64_t tid) = 0;
    virtual std::int64_t publishNews(std::int64_t author, const Article& article, const PostDraft& draft,
                                     std::uint64_t tid) = 0;

    // Root-to-post thread, at most maxLength entries, oldest first.
    virtual std::vector<PostView> thread(std::int64_t postId, std::size_t maxLength) = 0;
    virtual std::vector<std::int64_t> mentions(std::int64_t actor) = 0;
    virtual std::vector<std::int64_t> search(std::int64_t actor, const std::vector<std::string>& interests) = 0;
    virtual std::vector<Article> articles(const std::string& publisher) = 0;
    // Stance in [-1, 1] the actor's recent content shows per topic; topics
    // without content are absent.
    virtual std::map<std::string, double> sentiment(std::int64_t actor,
                                                    const std::vector<std::string>& topics) = 0;

    virtual void follow(std::int64_t actor, std::int64_t target, bool follow, std::uint64_t tid) = 0;
    virtual std::vector<std::int64_t> followers(std::int64_t actor) = 0;

    // Bookkeeping
    virtual void churn(const std::vector<std::int64_t>& actors, std::uint64_t tid) = 0;
    virtual void updateTime(std::uint32_t day, std::uint32_t hour) = 0;
    virtual void reset() = 0;
};

#endif
