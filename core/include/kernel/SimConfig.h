#ifndef SIM_CONFIG_H
#define SIM_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>
#include "kernel/ActionTypes.h"
#include "kernel/ActivitySampler.h"
#include "kernel/Dispatcher.h"
#include "modules/ActionHandlers.h"
#include "modules/ActorFactory.h"
#include "modules/PopulationManager.h"
#include "net/RecommenderGateway.h"

// ---------- Collaborator endpoints ----------
struct ServerConfig {
    std::string apiUrl = "http://127.0.0.1:5010/";   // content/graph service
    std::string llmUrl = "http://127.0.0.1:11434/v1"; // OpenAI-compatible endpoint
    std::string llmModel = "llama3";
    std::string llmApiKey;                            // sent as a bearer token when set
    int actionTimeoutMs = 30000;                      // per external call
};

// ---------- Simulation ----------
struct SimConfig {
    std::string name = "simulation";
    std::uint32_t days = 1;
    std::uint32_t slotsPerDay = 24;
    std::uint32_t startingAgents = 10;
    std::uint32_t startingPages = 0;       // generated pages when pages is empty
    std::vector<PageSpec> pages;           // explicit page list
    HourlyActivityTable hourlyActivity;
    ActionWeights actionWeights{};         // indexed by ActionKind
    double noopWeight = 0.0;               // "none" in actions_likelihood
    double pagePublishProbability = 1.0;
    bool limitDailyActions = false;        // enforce round_actions per day
    std::uint64_t seed = 42;

    ContentStrategy contentStrategy = ContentStrategy::Random;
    FollowStrategy followStrategy = FollowStrategy::Random;
    int visibilityRounds = 36;             // slots a post stays in content feeds

    ServerConfig servers;
    ProfileConfig profiles;
    PopulationConfig population;
    DispatcherConfig dispatch;
    HandlerSettings handlers;
};

#endif
