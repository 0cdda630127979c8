#ifndef FAKE_SERVICES_H
#define FAKE_SERVICES_H

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "modules/ActionHandlers.h"
#include "net/ContentService.h"
#include "net/GatewayError.h"
#include "net/LanguageBackend.h"
#include "net/RecommenderGateway.h"

// In-flight counter with a high-water mark
class ConcurrencyGauge {
public:
    void enter() {
        const int now = ++inFlight_;
        int prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
        }
    }
    void leave() { --inFlight_; }
    int peak() const { return peak_.load(); }

private:
    std::atomic<int> inFlight_{0};
    std::atomic<int> peak_{0};
};

// Scripted failures: the next n calls throw GatewayError(kind).
class FailureScript {
public:
    void failNext(int n, GatewayError::Kind kind = GatewayError::Kind::ServerError) {
        std::lock_guard<std::mutex> lock(mu_);
        remaining_ = n;
        kind_ = kind;
    }
    void maybeThrow(const char* call) {
        std::lock_guard<std::mutex> lock(mu_);
        if (remaining_ <= 0) return;
        --remaining_;
        throw GatewayError(kind_, std::string("scripted failure in ") + call, 503);
    }

private:
    std::mutex mu_;
    int remaining_ = 0;
    GatewayError::Kind kind_ = GatewayError::Kind::ServerError;
};

class FakeContentService : public ContentService {
public:
    std::chrono::milliseconds latency{0};
    FailureScript failures;          // applies to action calls
    int failRegistrations = 0;       // next n registrations fail
    bool failChurn = false;
    bool failFollow = false;
    int failFollowCall = 0;          // 1-based follow call that throws once
    bool failUpdateTime = false;

    std::int64_t registerActor(const ActorRecord& actor, std::uint32_t day) override {
        std::lock_guard<std::mutex> lock(mu_);
        if (failRegistrations > 0) {
            --failRegistrations;
            throw GatewayError(GatewayError::Kind::ServerError, "registration refused", 500);
        }
        registered.push_back({actor.profile.name, day});
        return nextServiceId_++;
    }

    std::int64_t publishPost(std::int64_t, const PostDraft& draft, std::uint64_t) override {
        call("post");
        std::lock_guard<std::mutex> lock(mu_);
        posts.push_back(draft.text);
        return nextPostId_++;
    }

    std::int64_t comment(std::int64_t, std::int64_t, const PostDraft&, std::uint64_t) override {
        call("comment");
        std::lock_guard<std::mutex> lock(mu_);
        return nextPostId_++;
    }

    std::int64_t share(std::int64_t, std::int64_t, const std::string&, std::uint64_t) override {
        call("share");
        std::lock_guard<std::mutex> lock(mu_);
        return nextPostId_++;
    }

    void react(std::int64_t, std::int64_t, Reaction, std::uint64_t) override { call("reaction"); }

    void castPreference(std::int64_t, std::int64_t, const std::string&, std::uint64_t) override {
        call("cast_preference");
    }

    std::int64_t publishNews(std::int64_t, const Article&, const PostDraft&, std::uint64_t) override {
        call("news");
        std::lock_guard<std::mutex> lock(mu_);
        return nextPostId_++;
    }

    std::vector<PostView> thread(std::int64_t postId, std::size_t) override {
        call("post_thread");
        return {PostView{postId, 1, "someone", "what a day for #science"}};
    }

    std::vector<std::int64_t> mentions(std::int64_t actor) override {
        call("read_mentions");
        std::lock_guard<std::mutex> lock(mu_);
        auto it = mentionsByActor.find(actor);
        return it == mentionsByActor.end() ? std::vector<std::int64_t>{} : it->second;
    }

    std::vector<std::int64_t> search(std::int64_t, const std::vector<std::string>&) override {
        call("search");
        return {7, 8, 9};
    }

    std::vector<Article> articles(const std::string& publisher) override {
        call("articles");
        return {Article{1, "Headline", "Summary of the story", "http://example.org/a", publisher}};
    }

    std::map<std::string, double> sentiment(std::int64_t actor,
                                            const std::vector<std::string>& topics) override {
        call("get_sentiment");
        std::lock_guard<std::mutex> lock(mu_);
        std::map<std::string, double> out;
        auto it = sentimentByActor.find(actor);
        if (it == sentimentByActor.end()) return out;
        for (const auto& t : topics) {
            auto s = it->second.find(t);
            if (s != it->second.end()) out[t] = s->second;
        }
        return out;
    }

    void follow(std::int64_t actor, std::int64_t target, bool, std::uint64_t) override {
        call("follow");
        std::lock_guard<std::mutex> lock(mu_);
        if (failFollow) throw GatewayError(GatewayError::Kind::Transport, "follow endpoint down");
        if (++followCalls_ == failFollowCall) {
            throw GatewayError(GatewayError::Kind::ServerError, "follow refused", 500);
        }
        follows.emplace_back(actor, target);
    }

    std::vector<std::int64_t> followers(std::int64_t) override { return {}; }

    void churn(const std::vector<std::int64_t>& actors, std::uint64_t) override {
        std::lock_guard<std::mutex> lock(mu_);
        if (failChurn) throw GatewayError(GatewayError::Kind::Transport, "churn endpoint down");
        churned.insert(churned.end(), actors.begin(), actors.end());
    }

    void updateTime(std::uint32_t day, std::uint32_t hour) override {
        std::lock_guard<std::mutex> lock(mu_);
        if (failUpdateTime) throw GatewayError(GatewayError::Kind::Timeout, "update_time timed out");
        lastTime = {day, hour};
        ++timeUpdates;
    }

    void reset() override { ++resets; }

    int callsTo(const std::string& endpoint) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = calls_.find(endpoint);
        return it == calls_.end() ? 0 : it->second;
    }

    // Recorded traffic (read after the slot drains)
    std::vector<std::pair<std::string, std::uint32_t>> registered;
    std::vector<std::string> posts;
    std::vector<std::pair<std::int64_t, std::int64_t>> follows;
    std::vector<std::int64_t> churned;
    std::map<std::int64_t, std::vector<std::int64_t>> mentionsByActor;
    std::map<std::int64_t, std::map<std::string, double>> sentimentByActor;
    std::pair<std::uint32_t, std::uint32_t> lastTime{0, 0};
    int timeUpdates = 0;
    int resets = 0;
    ConcurrencyGauge gauge;

private:
    void call(const char* endpoint) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            ++calls_[endpoint];
        }
        gauge.enter();
        if (latency.count() > 0) std::this_thread::sleep_for(latency);
        gauge.leave();
        failures.maybeThrow(endpoint);
    }

    mutable std::mutex mu_;
    std::map<std::string, int> calls_;
    int followCalls_ = 0;
    std::int64_t nextServiceId_ = 100;
    std::int64_t nextPostId_ = 1000;
};

class FakeLanguageBackend : public LanguageBackend {
public:
    std::chrono::milliseconds latency{0};
    std::string reply = "Lovely morning for a walk #outdoors";
    bool failAll = false;

    std::string complete(const CompletionRequest& request) override {
        ++calls;
        gauge.enter();
        if (latency.count() > 0) std::this_thread::sleep_for(latency);
        gauge.leave();
        if (failAll) throw GatewayError(GatewayError::Kind::Timeout, "language backend timed out");
        if (request.purpose == PromptPurpose::React) return "LIKE";
        return reply;
    }

    const char* name() const override { return "fake"; }

    std::atomic<int> calls{0};
    ConcurrencyGauge gauge;
};

class FakeRecommender : public RecommenderGateway {
public:
    std::vector<std::int64_t> feed = {11, 12, 13};
    std::vector<std::int64_t> suggestions;   // service ids handed to follow requests
    bool failFollowSuggestions = false;
    FailureScript failures;                  // applies to content requests

    std::vector<std::int64_t> contentCandidates(std::int64_t, std::size_t limit, bool) override {
        ++contentCalls;
        failures.maybeThrow("read");
        std::vector<std::int64_t> out = feed;
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    std::vector<std::int64_t> followCandidates(std::int64_t, std::size_t limit) override {
        ++followCalls;
        if (failFollowSuggestions) {
            throw GatewayError(GatewayError::Kind::Transport, "recommender unreachable");
        }
        std::vector<std::int64_t> out = suggestions;
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    std::atomic<int> contentCalls{0};
    std::atomic<int> followCalls{0};
};

// The three fakes wired together
struct FakeServices {
    FakeContentService content;
    FakeLanguageBackend language;
    FakeRecommender recommender;

    ActionServices services() { return ActionServices{&content, &language, &recommender}; }
};

#endif
