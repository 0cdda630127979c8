#ifndef HTTP_RECOMMENDER_H
#define HTTP_RECOMMENDER_H

#include "net/HttpClient.h"
#include "net/RecommenderGateway.h"

// Recommender modes evaluated by the simulation server (/read, /follow_suggestions).
class HttpRecommender : public RecommenderGateway {
public:
    HttpRecommender(const HttpClient& client, ContentStrategy content, FollowStrategy follow,
                    int visibilityRounds = 36, bool leaningBiased = true);

    std::vector<std::int64_t> contentCandidates(std::int64_t actor, std::size_t limit,
                                                bool articlesOnly = false) override;
    std::vector<std::int64_t> followCandidates(std::int64_t actor, std::size_t limit) override;

    ContentStrategy contentStrategy() const { return content_; }
    FollowStrategy followStrategy() const { return follow_; }

private:
    HttpClient http_;
    ContentStrategy content_;
    FollowStrategy follow_;
    int visibilityRounds_;
    bool leaningBiased_;
};

#endif
