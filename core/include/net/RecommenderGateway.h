#ifndef RECOMMENDER_GATEWAY_H
#define RECOMMENDER_GATEWAY_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------- Strategies ----------
// Scoring runs inside the content service; the simulator only picks a mode.
enum class ContentStrategy {
    ReverseChrono,
    ReverseChronoPopularity,
    ReverseChronoFollowers,
    ReverseChronoFollowersPopularity,
    ReverseChronoComments,
    CommonInterests,
    CommonUserInterests,
    SimilarUsersReact,
    SimilarUsersPosts,
    Random
};

enum class FollowStrategy {
    Random,
    CommonNeighbors,
    Jaccard,
    AdamicAdar,
    PreferentialAttachment
};

// Accept either the strategy class name ("ReverseChronoFollowersPopularity")
// or the wire mode ("rchrono_followers_popularity").
std::optional<ContentStrategy> parseContentStrategy(const std::string& name);
std::optional<FollowStrategy> parseFollowStrategy(const std::string& name);

const char* contentModeName(ContentStrategy strategy);
const char* followModeName(FollowStrategy strategy);

/**
 * Stable boundary to the pluggable recommenders. Ids are service ids.
 * Candidates come back best first; an empty list is a valid answer.
 */
class RecommenderGateway {
public:
    virtual ~RecommenderGateway() = default;

    virtual std::vector<std::int64_t> contentCandidates(std::int64_t actor, std::size_t limit,
                                                        bool articlesOnly = false) = 0;
    virtual std::vector<std::int64_t> followCandidates(std::int64_t actor, std::size_t limit) = 0;
};

#endif
