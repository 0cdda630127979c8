#ifndef HTTP_CONTENT_SERVICE_H
#define HTTP_CONTENT_SERVICE_H

#include "net/ContentService.h"
#include "net/HttpClient.h"

// ContentService over the simulation server's JSON/REST endpoints.
class HttpContentService : public ContentService {
public:
    explicit HttpContentService(const HttpClient& client) : http_(client) {}

    std::int64_t registerActor(const ActorRecord& actor, std::uint32_t day) override;

    std::int64_t publishPost(std::int64_t author, const PostDraft& draft, std::uint64_t tid) override;
    std::int64_t comment(std::int64_t author, std::int64_t postId, const PostDraft& draft,
                         std::uint64_t tid) override;
    std::int64_t share(std::int64_t author, std::int64_t postId, const std::string& note,
                       std::uint64_t tid) override;
    void react(std::int64_t author, std::int64_t postId, Reaction reaction, std::uint64_t tid) override;
    void castPreference(std::int64_t author, std::int64_t postId, const std::string& choice,
                        std::uint64_t tid) override;
    std::int64_t publishNews(std::int64_t author, const Article& article, const PostDraft& draft,
                             std::uint64_t tid) override;

    std::vector<PostView> thread(std::int64_t postId, std::size_t maxLength) override;
    std::vector<std::int64_t> mentions(std::int64_t actor) override;
    std::vector<std::int64_t> search(std::int64_t actor, const std::vector<std::string>& interests) override;
    std::vector<Article> articles(const std::string& publisher) override;
    std::map<std::string, double> sentiment(std::int64_t actor,
                                            const std::vector<std::string>& topics) override;

    void follow(std::int64_t actor, std::int64_t target, bool follow, std::uint64_t tid) override;
    std::vector<std::int64_t> followers(std::int64_t actor) override;

    void churn(const std::vector<std::int64_t>& actors, std::uint64_t tid) override;
    void updateTime(std::uint32_t day, std::uint32_t hour) override;
    void reset() override;

private:
    HttpClient http_;
};

// Reads a list of ids: [1,2], [{"id":1}], or {"1": score, ...}. Anything
// else throws GatewayError(Malformed).
std::vector<std::int64_t> idsFromJson(const Json::Value& value);

// Reads [{"topic": t, "sentiment": s}] or {"t": s}. A score is a number
// (clamped to [-1, 1]) or one of positive / neutral / negative.
std::map<std::string, double> sentimentFromJson(const Json::Value& value);

#endif
