#include "io/Snapshot.h"
#include <fstream>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace {

const Json::Value& require(const Json::Value& obj, const char* key) {
    if (!obj.isMember(key)) {
        throw std::invalid_argument(std::string("snapshot: missing field '") + key + "'");
    }
    return obj[key];
}

Json::Value stringList(const std::vector<std::string>& items) {
    Json::Value out(Json::arrayValue);
    for (const auto& s : items) out.append(s);
    return out;
}

std::vector<std::string> readStrings(const Json::Value& v) {
    std::vector<std::string> out;
    if (!v.isArray()) return out;
    for (const auto& item : v) out.push_back(item.asString());
    return out;
}

}  // namespace

Json::Value actorToJson(const ActorRecord& a) {
    Json::Value j(Json::objectValue);
    j["id"] = a.id;
    j["kind"] = actorKindName(a.kind);
    j["name"] = a.profile.name;
    j["email"] = a.profile.email;
    j["age"] = a.profile.age;
    j["gender"] = a.profile.gender;
    j["nationality"] = a.profile.nationality;
    j["language"] = a.profile.language;
    j["leaning"] = a.profile.leaning;
    j["education"] = a.profile.education;
    j["toxicity"] = a.profile.toxicity;
    j["interests"] = stringList(a.profile.interests);
    if (!a.profile.feedUrl.empty()) j["feed_url"] = a.profile.feedUrl;

    j["service_id"] = static_cast<Json::Int64>(a.serviceId);
    j["created_on_day"] = a.createdOnDay;
    j["lifecycle"] = a.live() ? "active" : "churned";
    if (!a.live()) j["churned_on_slot"] = static_cast<Json::Int64>(a.churnedOnSlot);

    j["activity_affinity"] = a.activityAffinity;
    j["round_actions"] = a.roundActions;
    j["requires_llm"] = a.requiresLlm;
    if (a.hasPersonalWeights) {
        Json::Value w(Json::objectValue);
        for (std::size_t k = 0; k < kActionKindCount; ++k) {
            w[kActionTraits[k].name] = a.actionWeights[k];
        }
        j["actions_likelihood"] = w;
    }

    j["last_active_slot"] = static_cast<Json::Int64>(a.lastActiveSlot);
    j["last_cast_day"] = static_cast<Json::Int64>(a.lastCastDay);
    Json::Value mentions(Json::arrayValue);
    for (auto m : a.pendingMentions) mentions.append(static_cast<Json::Int64>(m));
    j["pending_mentions"] = mentions;
    j["recent_interests"] = stringList(a.recentInterests);
    Json::Value opinions(Json::objectValue);
    for (const auto& [topic, stance] : a.opinions) opinions[topic] = stance;
    j["opinions"] = opinions;
    return j;
}

ActorRecord actorFromJson(const Json::Value& j) {
    if (!j.isObject()) throw std::invalid_argument("snapshot: actor entry is not an object");
    ActorRecord a;

    const Json::Value& id = require(j, "id");
    if (!id.isUInt()) throw std::invalid_argument("snapshot: actor id must be a non-negative integer");
    a.id = id.asUInt();
    a.profile.name = require(j, "name").asString();
    if (a.profile.name.empty()) throw std::invalid_argument("snapshot: actor without a name");

    a.kind = j.get("kind", "user").asString() == "page" ? ActorKind::Page : ActorKind::User;
    a.profile.email = j.get("email", "").asString();
    a.profile.age = j.get("age", a.profile.age).asInt();
    a.profile.gender = j.get("gender", "").asString();
    a.profile.nationality = j.get("nationality", "").asString();
    a.profile.language = j.get("language", a.profile.language).asString();
    a.profile.leaning = j.get("leaning", "").asString();
    a.profile.education = j.get("education", "").asString();
    a.profile.toxicity = j.get("toxicity", a.profile.toxicity).asString();
    a.profile.interests = readStrings(j["interests"]);
    a.profile.feedUrl = j.get("feed_url", "").asString();

    a.serviceId = j.get("service_id", Json::Int64(-1)).asInt64();
    a.createdOnDay = j.get("created_on_day", 0u).asUInt();
    const std::string lifecycle = j.get("lifecycle", "active").asString();
    if (lifecycle == "churned") {
        a.lifecycle = Lifecycle::Churned;
        a.churnedOnSlot = j.get("churned_on_slot", Json::Int64(-1)).asInt64();
    } else if (lifecycle != "active") {
        throw std::invalid_argument("snapshot: unknown lifecycle '" + lifecycle + "'");
    }

    a.activityAffinity = j.get("activity_affinity", 1.0).asDouble();
    a.roundActions = j.get("round_actions", 1u).asUInt();
    a.requiresLlm = j.get("requires_llm", true).asBool();
    if (j.isMember("actions_likelihood")) {
        const Json::Value& w = j["actions_likelihood"];
        for (const auto& name : w.getMemberNames()) {
            const auto kind = parseActionKind(name);
            if (!kind) throw std::invalid_argument("snapshot: unknown action '" + name + "'");
            a.actionWeights[actionIndex(*kind)] = w[name].asDouble();
        }
        a.hasPersonalWeights = true;
    }

    a.lastActiveSlot = j.get("last_active_slot", Json::Int64(-1)).asInt64();
    a.lastCastDay = j.get("last_cast_day", Json::Int64(-1)).asInt64();
    for (const auto& m : j["pending_mentions"]) a.pendingMentions.push_back(m.asInt64());
    a.recentInterests = readStrings(j["recent_interests"]);
    const Json::Value& opinions = j["opinions"];
    if (opinions.isObject()) {
        for (const auto& topic : opinions.getMemberNames()) {
            a.opinions[topic] = opinions[topic].asDouble();
        }
    }
    return a;
}

Json::Value populationToJson(const ActorPopulation& population, const FollowGraph& graph,
                             bool liveOnly) {
    Json::Value root(Json::objectValue);
    root["next_id"] = population.peekNextId();

    Json::Value agents(Json::arrayValue);
    for (const auto& a : population.all()) {
        if (liveOnly && !a.live()) continue;
        agents.append(actorToJson(a));
    }
    root["agents"] = agents;

    Json::Value edges(Json::arrayValue);
    for (const auto& e : graph.edges()) {
        Json::Value pair(Json::arrayValue);
        pair.append(e.follower);
        pair.append(e.followee);
        edges.append(pair);
    }
    root["edges"] = edges;
    return root;
}

void populationFromJson(const Json::Value& root, ActorPopulation& population, FollowGraph& graph) {
    if (!root.isObject()) throw std::invalid_argument("snapshot: root is not an object");
    population.clear();
    graph.clear();

    for (const auto& entry : require(root, "agents")) {
        population.add(actorFromJson(entry));
    }
    population.reserveIds(root.get("next_id", 0u).asUInt());

    for (const auto& pair : root["edges"]) {
        if (!pair.isArray() || pair.size() != 2) {
            throw std::invalid_argument("snapshot: edges must be [follower, followee] pairs");
        }
        const ActorId follower = pair[0].asUInt();
        const ActorId followee = pair[1].asUInt();
        const ActorRecord* a = population.find(follower);
        const ActorRecord* b = population.find(followee);
        // Edges touching actors not in the snapshot are dropped
        if (!a || !b || !a->live() || !b->live()) continue;
        graph.addEdge(follower, followee);
    }
}

void savePopulation(const std::string& path, const ActorPopulation& population,
                    const FollowGraph& graph, bool liveOnly) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot write snapshot '" + path + "'");

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(populationToJson(population, graph, liveOnly), &out);
    out << "\n";
    if (!out) throw std::runtime_error("failed writing snapshot '" + path + "'");
}

void loadPopulation(const std::string& path, ActorPopulation& population, FollowGraph& graph) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("cannot open snapshot '" + path + "'");

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        throw std::invalid_argument("snapshot '" + path + "' is not valid JSON: " + errs);
    }
    populationFromJson(root, population, graph);
}

Json::Value summaryToJson(const RunSummary& summary) {
    auto tallyJson = [](const ActionTally& t) {
        Json::Value j(Json::objectValue);
        j["succeeded"] = static_cast<Json::UInt64>(t.succeeded);
        j["failed"] = static_cast<Json::UInt64>(t.failed);
        j["skipped"] = static_cast<Json::UInt64>(t.skipped);
        return j;
    };

    Json::Value root(Json::objectValue);
    root["totals"] = tallyJson(summary.totals());
    root["noops"] = static_cast<Json::UInt64>(summary.totalNoops());
    root["churned"] = static_cast<Json::UInt64>(summary.totalChurned());
    root["recruited"] = static_cast<Json::UInt64>(summary.totalRecruited());
    root["follows_added"] = static_cast<Json::UInt64>(summary.totalFollowsAdded());

    Json::Value kinds(Json::objectValue);
    for (std::size_t k = 0; k < kActionKindCount; ++k) {
        const ActionTally t = summary.totalsFor(static_cast<ActionKind>(k));
        if (t.total() > 0) kinds[kActionTraits[k].name] = tallyJson(t);
    }
    root["by_kind"] = kinds;

    Json::Value days(Json::arrayValue);
    for (const auto& d : summary.days()) {
        Json::Value day = tallyJson(d.totals());
        day["day"] = d.day;
        day["noops"] = static_cast<Json::UInt64>(d.noops);
        day["active"] = static_cast<Json::UInt64>(d.activeSamples);
        if (d.boundaryRan) {
            day["live_before"] = static_cast<Json::UInt64>(d.boundary.liveBefore);
            day["live_after"] = static_cast<Json::UInt64>(d.boundary.liveAfter);
            day["churned"] = static_cast<Json::UInt64>(d.boundary.churned.size());
            day["recruited"] = static_cast<Json::UInt64>(d.boundary.recruited.size());
            day["follows_added"] = static_cast<Json::UInt64>(d.boundary.followsAdded);
            day["boundary_ok"] = d.boundary.ok();
        }
        days.append(day);
    }
    root["days"] = days;
    return root;
}

void logDayMetricsHeader(std::ostream& out) {
    out << "day,active,succeeded,failed,skipped,noops,live,churned,recruited,follows_added,edges\n";
}

void logDayMetrics(const DaySummary& day, const ActorPopulation& population,
                   const FollowGraph& graph, std::ostream& out) {
    const ActionTally t = day.totals();
    out << day.day << ","
        << day.activeSamples << ","
        << t.succeeded << ","
        << t.failed << ","
        << t.skipped << ","
        << day.noops << ","
        << population.liveCount() << ","
        << day.boundary.churned.size() << ","
        << day.boundary.recruited.size() << ","
        << day.boundary.followsAdded << ","
        << graph.edgeCount() << "\n";
}
