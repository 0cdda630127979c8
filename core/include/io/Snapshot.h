#ifndef POPULATION_SNAPSHOT_H
#define POPULATION_SNAPSHOT_H

#include <iosfwd>
#include <string>
#include <json/json.h>
#include "kernel/ActorPopulation.h"
#include "kernel/FollowGraph.h"
#include "kernel/RunSummary.h"

// ---------- Population snapshots ----------
Json::Value actorToJson(const ActorRecord& actor);
// Throws std::invalid_argument on missing or mistyped fields.
ActorRecord actorFromJson(const Json::Value& value);

// {"next_id": n, "agents": [...], "edges": [[follower, followee], ...]}
// With liveOnly, churned actors and their (already removed) edges are left out.
Json::Value populationToJson(const ActorPopulation& population, const FollowGraph& graph,
                             bool liveOnly = false);
void populationFromJson(const Json::Value& root, ActorPopulation& population, FollowGraph& graph);

void savePopulation(const std::string& path, const ActorPopulation& population,
                    const FollowGraph& graph, bool liveOnly = true);
void loadPopulation(const std::string& path, ActorPopulation& population, FollowGraph& graph);

// ---------- Run reports ----------
Json::Value summaryToJson(const RunSummary& summary);

// CSV metrics logging, one row per finished day
void logDayMetricsHeader(std::ostream& out);
void logDayMetrics(const DaySummary& day, const ActorPopulation& population,
                   const FollowGraph& graph, std::ostream& out);

#endif
