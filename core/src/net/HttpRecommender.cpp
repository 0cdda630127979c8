#include "net/HttpRecommender.h"
#include "net/HttpContentService.h"
#include <algorithm>
#include <cctype>

namespace {

struct ContentEntry {
    ContentStrategy strategy;
    const char* className;
    const char* mode;
};

struct FollowEntry {
    FollowStrategy strategy;
    const char* className;
    const char* mode;
};

const ContentEntry kContentModes[] = {
    {ContentStrategy::ReverseChrono, "ReverseChrono", "rchrono"},
    {ContentStrategy::ReverseChronoPopularity, "ReverseChronoPopularity", "rchrono_popularity"},
    {ContentStrategy::ReverseChronoFollowers, "ReverseChronoFollowers", "rchrono_followers"},
    {ContentStrategy::ReverseChronoFollowersPopularity, "ReverseChronoFollowersPopularity",
     "rchrono_followers_popularity"},
    {ContentStrategy::ReverseChronoComments, "ReverseChronoComments", "rchrono_comments"},
    {ContentStrategy::CommonInterests, "CommonInterests", "common_interests"},
    {ContentStrategy::CommonUserInterests, "CommonUserInterests", "common_user_interests"},
    {ContentStrategy::SimilarUsersReact, "SimilarUsersReactions", "similar_users"},
    {ContentStrategy::SimilarUsersPosts, "SimilarUsersPosts", "similar_users_posts"},
    {ContentStrategy::Random, "ContentRecSys", "default"},
};

const FollowEntry kFollowModes[] = {
    {FollowStrategy::Random, "FollowRecSys", "random"},
    {FollowStrategy::CommonNeighbors, "CommonNeighbors", "common_neighbors"},
    {FollowStrategy::Jaccard, "Jaccard", "jaccard"},
    {FollowStrategy::AdamicAdar, "AdamicAdar", "adamic_adar"},
    {FollowStrategy::PreferentialAttachment, "PreferentialAttachment", "preferential_attachment"},
};

bool equalsIgnoreCase(const std::string& a, const char* b) {
    const std::string rhs(b);
    return a.size() == rhs.size() &&
           std::equal(a.begin(), a.end(), rhs.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

std::optional<ContentStrategy> parseContentStrategy(const std::string& name) {
    for (const auto& e : kContentModes) {
        if (equalsIgnoreCase(name, e.className) || equalsIgnoreCase(name, e.mode)) return e.strategy;
    }
    return std::nullopt;
}

std::optional<FollowStrategy> parseFollowStrategy(const std::string& name) {
    for (const auto& e : kFollowModes) {
        if (equalsIgnoreCase(name, e.className) || equalsIgnoreCase(name, e.mode)) return e.strategy;
    }
    return std::nullopt;
}

const char* contentModeName(ContentStrategy strategy) {
    for (const auto& e : kContentModes) {
        if (e.strategy == strategy) return e.mode;
    }
    return "default";
}

const char* followModeName(FollowStrategy strategy) {
    for (const auto& e : kFollowModes) {
        if (e.strategy == strategy) return e.mode;
    }
    return "random";
}

HttpRecommender::HttpRecommender(const HttpClient& client, ContentStrategy content,
                                 FollowStrategy follow, int visibilityRounds, bool leaningBiased)
    : http_(client),
      content_(content),
      follow_(follow),
      visibilityRounds_(visibilityRounds),
      leaningBiased_(leaningBiased) {}

std::vector<std::int64_t> HttpRecommender::contentCandidates(std::int64_t actor, std::size_t limit,
                                                             bool articlesOnly) {
    Json::Value body;
    body["uid"] = Json::Int64(actor);
    body["limit"] = static_cast<Json::UInt64>(limit);
    body["mode"] = contentModeName(content_);
    body["visibility_rounds"] = visibilityRounds_;
    if (articlesOnly) body["articles"] = true;

    auto ids = idsFromJson(http_.postJson("/read", body));
    if (ids.size() > limit) ids.resize(limit);
    return ids;
}

std::vector<std::int64_t> HttpRecommender::followCandidates(std::int64_t actor, std::size_t limit) {
    Json::Value body;
    body["user_id"] = Json::Int64(actor);
    body["n_neighbors"] = static_cast<Json::UInt64>(limit);
    body["leaning_biased"] = leaningBiased_ ? 1 : 0;
    body["mode"] = followModeName(follow_);

    auto ids = idsFromJson(http_.postJson("/follow_suggestions", body));
    if (ids.size() > limit) ids.resize(limit);
    return ids;
}
