#ifndef DISPATCHER_H
#define DISPATCHER_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include "kernel/ActorPopulation.h"
#include "kernel/Executor.h"
#include "kernel/FollowGraph.h"
#include "kernel/SimClock.h"
#include "modules/ActionHandlers.h"

// ---------- Configuration ----------
struct DispatcherConfig {
    bool parallel = true;               // false: everything in order on the calling thread
    std::size_t cpuWorkers = 0;         // light pool size, 0 = one per processor
    double heavyCapacity = 1.0;         // accelerator units available to heavy tasks
    double heavyUnit = 0.1;             // units held by one in-flight heavy task
    std::size_t heavyQueueDepth = 1000; // heavy intents allowed to wait beyond the cap
    int lightRetries = 2;               // extra attempts for idempotent light actions
    std::uint64_t seed = 42;
};

// floor(heavyCapacity / heavyUnit), at least 1. Throws std::invalid_argument
// unless 0 < heavyUnit <= heavyCapacity.
std::size_t heavyConcurrency(const DispatcherConfig& cfg);

// Counting gate; blocks acquire() while limit tasks are in flight.
class AdmissionGate {
public:
    explicit AdmissionGate(std::size_t limit) : limit_(limit) {}

    void acquire();
    void release();

    std::size_t limit() const { return limit_; }
    std::size_t inFlight() const;
    std::size_t peak() const { return peak_.load(); }
    // Restarts the high-water mark from the current in-flight count.
    void resetPeak();

private:
    std::size_t limit_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::size_t inFlight_ = 0;
    std::atomic<std::size_t> peak_{0};
};

struct DispatchStats {
    std::size_t light = 0;
    std::size_t heavy = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t peakHeavyInFlight = 0;  // this dispatch only
    double wallMs = 0.0;
};

/**
 * Executes one slot's intents.
 *
 * Light intents (content service only) run on the light executor; heavy
 * intents (language backend) run on the heavy executor behind an admission
 * gate of heavyConcurrency() slots. Both lanes run concurrently in parallel
 * mode. Every intent goes through execute(), which times it, retries
 * transient failures of idempotent light actions, and turns exceptions into
 * a failed ActionResult, so one actor never takes down the batch.
 *
 * Results come back in batch order and do not depend on scheduling: each
 * intent draws from its own RNG seeded by (seed, slot, actor, kind).
 */
class Dispatcher {
public:
    Dispatcher(const DispatcherConfig& cfg, HandlerSettings settings,
               std::unique_ptr<Executor> lightExecutor = nullptr,
               std::unique_ptr<Executor> heavyExecutor = nullptr);

    // Throws std::invalid_argument if an actor appears twice or is unknown.
    std::vector<ActionResult> dispatch(const std::vector<ActionIntent>& batch,
                                       ActorPopulation& population,
                                       const FollowGraph& graph,
                                       const ActionServices& services,
                                       const SlotInfo& slot);

    std::size_t maxHeavyInFlight() const { return gate_.limit(); }
    // High-water mark over every dispatch so far
    std::size_t peakHeavyInFlight() const { return lifetimePeak_; }
    const DispatchStats& lastStats() const { return stats_; }
    const DispatcherConfig& config() const { return cfg_; }
    const HandlerSettings& settings() const { return settings_; }
    const Executor& lightExecutor() const { return *light_; }
    const Executor& heavyExecutor() const { return *heavy_; }

private:
    ActionResult execute(const ActionIntent& intent, ActorRecord& actor,
                         const ActorPopulation& population, const FollowGraph& graph,
                         const ActionServices& services, const SlotInfo& slot) const;

    DispatcherConfig cfg_;
    HandlerSettings settings_;
    std::unique_ptr<Executor> light_;
    std::unique_ptr<Executor> heavy_;
    AdmissionGate gate_;
    DispatchStats stats_;
    std::size_t lifetimePeak_ = 0;
};

// Seed for an intent's private RNG stream.
std::uint64_t intentSeed(std::uint64_t seed, const ActionIntent& intent);

#endif
