#include "modules/ActionHandlers.h"
#include "modules/TextUtils.h"
#include "net/GatewayError.h"
#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>

namespace {

ContentService& content(ActionContext& ctx) {
    if (!ctx.services.content) throw std::logic_error("no content service configured");
    return *ctx.services.content;
}

LanguageBackend& language(ActionContext& ctx) {
    if (!ctx.services.language) throw std::logic_error("no language backend configured");
    return *ctx.services.language;
}

RecommenderGateway& recommender(ActionContext& ctx) {
    if (!ctx.services.recommender) throw std::logic_error("no recommender configured");
    return *ctx.services.recommender;
}

std::optional<std::int64_t> pickOne(const std::vector<std::int64_t>& ids, std::mt19937_64& rng) {
    if (ids.empty()) return std::nullopt;
    std::uniform_int_distribution<std::size_t> pick(0, ids.size() - 1);
    return ids[pick(rng)];
}

std::optional<std::int64_t> pickFromFeed(const ActorRecord& actor, ActionContext& ctx) {
    return pickOne(recommender(ctx).contentCandidates(actor.serviceId, ctx.settings.feedSize), ctx.rng);
}

// Generated text -> publishable draft
PostDraft draftFrom(const ActorRecord& actor, const std::string& raw, ActionContext& ctx) {
    PostDraft draft;
    draft.text = cleanText(raw, actor.profile.name);
    if (draft.text.empty()) {
        throw GatewayError(GatewayError::Kind::Malformed, "language backend returned empty text");
    }
    draft.hashtags = extractTags(draft.text, '#');
    draft.mentions = extractTags(draft.text, '@');

    if (ctx.settings.annotateEmotions && !ctx.settings.emotions.empty()) {
        const std::string annotation = language(ctx).complete(
            emotionPrompt(draft.text, ctx.settings.emotions, ctx.settings.generation));
        draft.emotions = cleanEmotions(annotation, ctx.settings.emotions);
    }
    return draft;
}

std::vector<std::string> pickTopics(const ActorRecord& actor, std::mt19937_64& rng) {
    std::vector<std::string> pool = actor.profile.interests;
    if (pool.empty()) return pool;
    std::shuffle(pool.begin(), pool.end(), rng);
    std::uniform_int_distribution<std::size_t> count(1, std::min<std::size_t>(2, pool.size()));
    pool.resize(count(rng));
    return pool;
}

constexpr std::size_t kRecentInterestWindow = 10;

void rememberInterests(ActorRecord& actor, const std::vector<std::string>& topics) {
    for (const auto& t : topics) {
        actor.recentInterests.push_back(t);
    }
    if (actor.recentInterests.size() > kRecentInterestWindow) {
        actor.recentInterests.erase(actor.recentInterests.begin(),
                                    actor.recentInterests.end() -
                                        static_cast<std::ptrdiff_t>(kRecentInterestWindow));
    }
}

// Interests in recent use, else the profile's, without duplicates
std::vector<std::string> currentTopics(const ActorRecord& actor) {
    const auto& source =
        actor.recentInterests.empty() ? actor.profile.interests : actor.recentInterests;
    std::vector<std::string> topics;
    for (const auto& t : source) {
        if (std::find(topics.begin(), topics.end(), t) == topics.end()) topics.push_back(t);
    }
    return topics;
}

// Topics the actor has no stance on yet take the one its own content shows.
void seedOpinions(ActorRecord& actor, const std::vector<std::string>& topics, ActionContext& ctx) {
    if (!ctx.settings.opinions.enabled || topics.empty()) return;
    for (const auto& [topic, stance] : content(ctx).sentiment(actor.serviceId, topics)) {
        actor.opinions.emplace(topic, stance);
    }
}

// Bounded-confidence update towards the most recent other author in the thread.
void meetAuthor(ActorRecord& actor, const std::vector<PostView>& thread, ActionContext& ctx) {
    if (!ctx.settings.opinions.enabled) return;
    for (auto it = thread.rbegin(); it != thread.rend(); ++it) {
        if (it->author < 0 || it->author == actor.serviceId) continue;
        const auto topics = currentTopics(actor);
        if (topics.empty()) return;
        updateOpinions(actor.opinions, content(ctx).sentiment(it->author, topics),
                       ctx.settings.opinions);
        return;
    }
}

}  // namespace

void handlePost(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    const auto topics = pickTopics(actor, ctx.rng);
    seedOpinions(actor, topics, ctx);
    const std::string text =
        language(ctx).complete(postPrompt(actor, topics, ctx.settings.generation));
    const PostDraft draft = draftFrom(actor, text, ctx);

    ctx.result.postId = content(ctx).publishPost(actor.serviceId, draft, intent.slot);
    rememberInterests(actor, topics);
}

void handleComment(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    const auto postId = pickFromFeed(actor, ctx);
    if (!postId) return;  // empty feed, nothing to comment on

    const auto thread = content(ctx).thread(*postId, ctx.settings.maxThreadLength);
    seedOpinions(actor, currentTopics(actor), ctx);
    const std::string text =
        language(ctx).complete(commentPrompt(actor, thread, ctx.settings.generation));
    const PostDraft draft = draftFrom(actor, text, ctx);

    ctx.result.postId = content(ctx).comment(actor.serviceId, *postId, draft, intent.slot);
    meetAuthor(actor, thread, ctx);
}

void handleRead(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    (void)intent;
    // Feed read marks posts as seen on the service side
    recommender(ctx).contentCandidates(actor.serviceId, ctx.settings.feedSize);
    const auto mentions = content(ctx).mentions(actor.serviceId);

    for (auto id : mentions) {
        if (std::find(actor.pendingMentions.begin(), actor.pendingMentions.end(), id) ==
            actor.pendingMentions.end()) {
            actor.pendingMentions.push_back(id);
            ctx.result.mentions.push_back(id);
        }
    }
}

void handleShare(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    const auto postId = pickFromFeed(actor, ctx);
    if (!postId) return;

    const auto thread = content(ctx).thread(*postId, ctx.settings.maxThreadLength);
    const std::string note = cleanText(
        language(ctx).complete(sharePrompt(actor, thread, ctx.settings.generation)),
        actor.profile.name);
    ctx.result.postId = content(ctx).share(actor.serviceId, *postId, note, intent.slot);
}

void handleReply(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    if (!intent.target) {
        throw std::invalid_argument("reply intent without a target mention");
    }
    const std::int64_t target = *intent.target;

    const auto thread = content(ctx).thread(target, ctx.settings.maxThreadLength);
    seedOpinions(actor, currentTopics(actor), ctx);
    const std::string text =
        language(ctx).complete(replyPrompt(actor, thread, ctx.settings.generation));
    const PostDraft draft = draftFrom(actor, text, ctx);
    ctx.result.postId = content(ctx).comment(actor.serviceId, target, draft, intent.slot);
    meetAuthor(actor, thread, ctx);

    auto it = std::find(actor.pendingMentions.begin(), actor.pendingMentions.end(), target);
    if (it != actor.pendingMentions.end()) actor.pendingMentions.erase(it);
}

void handleSearch(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    (void)intent;
    const auto& interests =
        actor.recentInterests.empty() ? actor.profile.interests : actor.recentInterests;
    const auto hits = content(ctx).search(actor.serviceId, interests);
    if (auto seen = pickOne(hits, ctx.rng)) ctx.result.postId = *seen;
}

void handleFollow(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    const auto candidates =
        recommender(ctx).followCandidates(actor.serviceId, ctx.settings.followCandidates);

    // First live, not-yet-followed suggestion
    for (auto serviceId : candidates) {
        const ActorRecord* target = ctx.population.findByServiceId(serviceId);
        if (!target || !target->live() || target->id == actor.id) continue;
        if (ctx.graph.hasEdge(actor.id, target->id)) continue;

        content(ctx).follow(actor.serviceId, serviceId, true, intent.slot);
        ctx.result.follows.push_back({actor.id, target->id});
        return;
    }
}

void handleCast(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    const auto postId = pickFromFeed(actor, ctx);
    if (postId && !ctx.settings.castOptions.empty()) {
        const auto thread = content(ctx).thread(*postId, ctx.settings.maxThreadLength);
        const std::string answer = language(ctx).complete(
            castPrompt(actor, thread, ctx.settings.castOptions, ctx.settings.generation));
        if (auto choice = parseChoice(answer, ctx.settings.castOptions)) {
            content(ctx).castPreference(actor.serviceId, *postId, *choice, intent.slot);
        }
    }
    actor.lastCastDay = ctx.slot.day;
}

void handleReact(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    const auto postId = pickFromFeed(actor, ctx);
    if (!postId) return;

    const auto thread = content(ctx).thread(*postId, 1);
    const std::string answer =
        language(ctx).complete(reactPrompt(actor, thread, ctx.settings.generation));
    if (auto reaction = parseReaction(answer)) {
        content(ctx).react(actor.serviceId, *postId, *reaction, intent.slot);
        meetAuthor(actor, thread, ctx);
    }
}

void handleNews(ActorRecord& actor, const ActionIntent& intent, ActionContext& ctx) {
    // Pages publish from their own outlet; users pick from whatever the service holds
    const std::string publisher = actor.isPage() ? actor.profile.name : std::string();
    const auto articles = content(ctx).articles(publisher);
    if (articles.empty()) return;

    std::uniform_int_distribution<std::size_t> pick(0, articles.size() - 1);
    const Article& article = articles[pick(ctx.rng)];

    const std::string text =
        language(ctx).complete(newsPrompt(actor, article, ctx.settings.generation));
    const PostDraft draft = draftFrom(actor, text, ctx);
    ctx.result.postId = content(ctx).publishNews(actor.serviceId, article, draft, intent.slot);
}
