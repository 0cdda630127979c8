#include "net/HttpContentService.h"
#include "net/GatewayError.h"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace {

Json::Value stringArray(const std::vector<std::string>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& s : items) arr.append(s);
    return arr;
}

Json::Value draftBody(std::int64_t author, const PostDraft& draft, std::uint64_t tid) {
    Json::Value body;
    body["user_id"] = Json::Int64(author);
    body["tweet"] = draft.text;
    body["emotions"] = stringArray(draft.emotions);
    body["hashtags"] = stringArray(draft.hashtags);
    body["mentions"] = stringArray(draft.mentions);
    body["tid"] = Json::UInt64(tid);
    return body;
}

std::int64_t requireId(const Json::Value& reply, const char* endpoint) {
    if (reply.isObject() && reply.isMember("id") && reply["id"].isIntegral()) {
        return reply["id"].asInt64();
    }
    if (reply.isIntegral()) return reply.asInt64();
    throw GatewayError(GatewayError::Kind::Malformed,
                       std::string(endpoint) + ": reply carries no id");
}

std::optional<double> stanceOf(const Json::Value& score) {
    if (score.isNumeric()) return std::clamp(score.asDouble(), -1.0, 1.0);
    if (!score.isString()) return std::nullopt;
    std::string label = score.asString();
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (label == "positive") return 1.0;
    if (label == "negative") return -1.0;
    if (label == "neutral") return 0.0;
    return std::nullopt;
}

}  // namespace

std::map<std::string, double> sentimentFromJson(const Json::Value& value) {
    std::map<std::string, double> out;
    if (value.isNull()) return out;

    auto add = [&](const std::string& topic, const Json::Value& score) {
        const auto stance = stanceOf(score);
        if (!stance) {
            throw GatewayError(GatewayError::Kind::Malformed,
                               "/get_sentiment: unreadable score for topic '" + topic + "'");
        }
        out[topic] = *stance;
    };

    if (value.isArray()) {
        for (const auto& item : value) {
            if (!item.isObject() || !item["topic"].isString()) {
                throw GatewayError(GatewayError::Kind::Malformed,
                                   "/get_sentiment: entry without a topic");
            }
            add(item["topic"].asString(), item["sentiment"]);
        }
        return out;
    }
    if (value.isObject()) {
        for (const auto& topic : value.getMemberNames()) add(topic, value[topic]);
        return out;
    }
    throw GatewayError(GatewayError::Kind::Malformed, "/get_sentiment: expected a list");
}

std::vector<std::int64_t> idsFromJson(const Json::Value& value) {
    std::vector<std::int64_t> ids;
    if (value.isNull()) return ids;

    if (value.isArray()) {
        for (const auto& item : value) {
            if (item.isIntegral()) {
                ids.push_back(item.asInt64());
            } else if (item.isObject() && item["id"].isIntegral()) {
                ids.push_back(item["id"].asInt64());
            } else {
                throw GatewayError(GatewayError::Kind::Malformed, "unexpected id list entry");
            }
        }
        return ids;
    }

    if (value.isObject()) {
        // {"<id>": score} as returned by the follow recommender, best first
        std::vector<std::pair<double, std::int64_t>> scored;
        for (const auto& key : value.getMemberNames()) {
            try {
                scored.emplace_back(value[key].isNumeric() ? value[key].asDouble() : 0.0,
                                    std::stoll(key));
            } catch (const std::exception&) {
                throw GatewayError(GatewayError::Kind::Malformed, "non-numeric id key: " + key);
            }
        }
        std::stable_sort(scored.begin(), scored.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });
        for (const auto& [score, id] : scored) ids.push_back(id);
        return ids;
    }

    throw GatewayError(GatewayError::Kind::Malformed, "expected a list of ids");
}

std::int64_t HttpContentService::registerActor(const ActorRecord& actor, std::uint32_t day) {
    const ActorProfile& p = actor.profile;
    Json::Value body;
    body["name"] = p.name;
    body["email"] = p.email;
    body["password"] = p.name;
    body["leaning"] = p.leaning;
    body["age"] = p.age;
    body["user_type"] = actor.requiresLlm ? "llm" : "fake";
    body["language"] = p.language;
    body["education_level"] = p.education;
    body["round_actions"] = actor.roundActions;
    body["gender"] = p.gender;
    body["nationality"] = p.nationality;
    body["toxicity"] = p.toxicity;
    body["joined_on"] = day;
    body["is_page"] = actor.isPage() ? 1 : 0;
    body["daily_activity_level"] = actor.activityAffinity;
    body["interests"] = stringArray(p.interests);
    if (actor.isPage()) body["feed_url"] = p.feedUrl;
    return requireId(http_.postJson("/register", body), "/register");
}

std::int64_t HttpContentService::publishPost(std::int64_t author, const PostDraft& draft,
                                             std::uint64_t tid) {
    return requireId(http_.postJson("/post", draftBody(author, draft, tid)), "/post");
}

std::int64_t HttpContentService::comment(std::int64_t author, std::int64_t postId,
                                         const PostDraft& draft, std::uint64_t tid) {
    Json::Value body = draftBody(author, draft, tid);
    body["post_id"] = Json::Int64(postId);
    return requireId(http_.postJson("/comment", body), "/comment");
}

std::int64_t HttpContentService::share(std::int64_t author, std::int64_t postId,
                                       const std::string& note, std::uint64_t tid) {
    Json::Value body;
    body["user_id"] = Json::Int64(author);
    body["post_id"] = Json::Int64(postId);
    body["text"] = note;
    body["tid"] = Json::UInt64(tid);
    return requireId(http_.postJson("/share", body), "/share");
}

void HttpContentService::react(std::int64_t author, std::int64_t postId, Reaction reaction,
                               std::uint64_t tid) {
    Json::Value body;
    body["user_id"] = Json::Int64(author);
    body["post_id"] = Json::Int64(postId);
    body["type"] = reaction == Reaction::Like ? "like" : "dislike";
    body["tid"] = Json::UInt64(tid);
    http_.postJsonNoReply("/reaction", body);
}

void HttpContentService::castPreference(std::int64_t author, std::int64_t postId,
                                        const std::string& choice, std::uint64_t tid) {
    Json::Value body;
    body["user_id"] = Json::Int64(author);
    body["tweet_id"] = Json::Int64(postId);
    body["polarity"] = choice;
    body["tid"] = Json::UInt64(tid);
    http_.postJsonNoReply("/cast_preference", body);
}

std::int64_t HttpContentService::publishNews(std::int64_t author, const Article& article,
                                             const PostDraft& draft, std::uint64_t tid) {
    Json::Value body = draftBody(author, draft, tid);
    body["title"] = article.title;
    body["summary"] = article.summary;
    body["link"] = article.link;
    body["publisher"] = article.publisher;
    return requireId(http_.postJson("/news", body), "/news");
}

std::vector<PostView> HttpContentService::thread(std::int64_t postId, std::size_t maxLength) {
    Json::Value body;
    body["post_id"] = Json::Int64(postId);
    const Json::Value reply = http_.postJson("/post_thread", body);
    if (!reply.isArray()) {
        throw GatewayError(GatewayError::Kind::Malformed, "/post_thread: expected an array");
    }

    std::vector<PostView> posts;
    for (const auto& item : reply) {
        PostView view;
        if (item.isString()) {
            view.text = item.asString();
        } else if (item.isObject()) {
            view.id = item.get("id", -1).asInt64();
            view.author = item.get("user_id", -1).asInt64();
            view.authorName = item.get("username", "").asString();
            view.text = item.get("tweet", item.get("text", "")).asString();
        } else {
            continue;
        }
        posts.push_back(std::move(view));
    }
    // Keep the most recent maxLength entries
    if (maxLength > 0 && posts.size() > maxLength) {
        posts.erase(posts.begin(), posts.end() - static_cast<std::ptrdiff_t>(maxLength));
    }
    return posts;
}

std::vector<std::int64_t> HttpContentService::mentions(std::int64_t actor) {
    Json::Value body;
    body["uid"] = Json::Int64(actor);
    return idsFromJson(http_.postJson("/read_mentions", body));
}

std::vector<std::int64_t> HttpContentService::search(std::int64_t actor,
                                                     const std::vector<std::string>& interests) {
    Json::Value body;
    body["uid"] = Json::Int64(actor);
    body["interests"] = stringArray(interests);
    return idsFromJson(http_.postJson("/search", body));
}

std::vector<Article> HttpContentService::articles(const std::string& publisher) {
    Json::Value body;
    body["publisher"] = publisher;
    const Json::Value reply = http_.postJson("/articles", body);
    if (!reply.isArray()) {
        throw GatewayError(GatewayError::Kind::Malformed, "/articles: expected an array");
    }
    std::vector<Article> out;
    for (const auto& item : reply) {
        Article a;
        a.id = item.get("id", -1).asInt64();
        a.title = item.get("title", "").asString();
        a.summary = item.get("summary", "").asString();
        a.link = item.get("link", "").asString();
        a.publisher = item.get("publisher", publisher).asString();
        out.push_back(std::move(a));
    }
    return out;
}

std::map<std::string, double> HttpContentService::sentiment(
    std::int64_t actor, const std::vector<std::string>& topics) {
    Json::Value body;
    body["user_id"] = Json::Int64(actor);
    body["interests"] = stringArray(topics);
    return sentimentFromJson(http_.postJson("/get_sentiment", body));
}

void HttpContentService::follow(std::int64_t actor, std::int64_t target, bool follow,
                                std::uint64_t tid) {
    Json::Value body;
    body["user_id"] = Json::Int64(actor);
    body["target"] = Json::Int64(target);
    body["action"] = follow ? "follow" : "unfollow";
    body["tid"] = Json::UInt64(tid);
    http_.postJsonNoReply("/follow", body);
}

std::vector<std::int64_t> HttpContentService::followers(std::int64_t actor) {
    Json::Value body;
    body["user_id"] = Json::Int64(actor);
    return idsFromJson(http_.postJson("/followers", body));
}

void HttpContentService::churn(const std::vector<std::int64_t>& actors, std::uint64_t tid) {
    Json::Value body;
    Json::Value ids(Json::arrayValue);
    for (auto id : actors) ids.append(Json::Int64(id));
    body["user_ids"] = ids;
    body["n_users"] = static_cast<Json::UInt64>(actors.size());
    body["left_on"] = Json::UInt64(tid);
    http_.postJsonNoReply("/churn", body);
}

void HttpContentService::updateTime(std::uint32_t day, std::uint32_t hour) {
    Json::Value body;
    body["day"] = day;
    body["round"] = hour;
    http_.postJsonNoReply("/update_time", body);
}

void HttpContentService::reset() {
    http_.postJsonNoReply("/reset", Json::Value(Json::objectValue));
}
