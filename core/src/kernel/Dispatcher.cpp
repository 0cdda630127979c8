#include "kernel/Dispatcher.h"
#include "net/GatewayError.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>

namespace {

constexpr double kCapacityEpsilon = 1e-9;

// Holds one heavy slot for the lifetime of a task
class GateSlot {
public:
    explicit GateSlot(AdmissionGate& gate) : gate_(gate) { gate_.acquire(); }
    ~GateSlot() { gate_.release(); }
    GateSlot(const GateSlot&) = delete;
    GateSlot& operator=(const GateSlot&) = delete;

private:
    AdmissionGate& gate_;
};

ActionResult skippedResult(const ActionIntent& intent) {
    ActionResult r;
    r.actor = intent.actor;
    r.slot = intent.slot;
    r.kind = intent.kind;
    r.status = ActionStatus::Skipped;
    r.cause = FailureCause::QueueFull;
    r.error = "heavy queue full";
    return r;
}

}  // namespace

std::size_t heavyConcurrency(const DispatcherConfig& cfg) {
    if (!(cfg.heavyUnit > 0.0)) {
        throw std::invalid_argument("heavyUnit must be > 0 (got " + std::to_string(cfg.heavyUnit) + ")");
    }
    if (cfg.heavyUnit > cfg.heavyCapacity + kCapacityEpsilon) {
        throw std::invalid_argument("heavyUnit (" + std::to_string(cfg.heavyUnit) +
                                    ") must not exceed heavyCapacity (" +
                                    std::to_string(cfg.heavyCapacity) + ")");
    }
    const double slots = std::floor(cfg.heavyCapacity / cfg.heavyUnit + kCapacityEpsilon);
    return std::max<std::size_t>(1, static_cast<std::size_t>(slots));
}

std::uint64_t intentSeed(std::uint64_t seed, const ActionIntent& intent) {
    std::uint64_t h = seed ^ 0x9E3779B97F4A7C15ULL;
    h ^= (intent.slot + 1) * 0xBF58476D1CE4E5B9ULL;
    h = (h ^ (h >> 31)) * 0x94D049BB133111EBULL;
    h ^= (static_cast<std::uint64_t>(intent.actor) + 1) * 0x9E3779B97F4A7C15ULL;
    h = (h ^ (h >> 29)) * 0xBF58476D1CE4E5B9ULL;
    h ^= static_cast<std::uint64_t>(intent.kind) + 1;
    return h ^ (h >> 32);
}

// ---------- AdmissionGate ----------
void AdmissionGate::acquire() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return inFlight_ < limit_; });
    ++inFlight_;
    std::size_t prev = peak_.load();
    while (inFlight_ > prev && !peak_.compare_exchange_weak(prev, inFlight_)) {
    }
}

void AdmissionGate::resetPeak() {
    std::lock_guard<std::mutex> lock(mu_);
    peak_.store(inFlight_);
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        --inFlight_;
    }
    cv_.notify_one();
}

std::size_t AdmissionGate::inFlight() const {
    std::lock_guard<std::mutex> lock(mu_);
    return inFlight_;
}

// ---------- Dispatcher ----------
Dispatcher::Dispatcher(const DispatcherConfig& cfg, HandlerSettings settings,
                       std::unique_ptr<Executor> lightExecutor,
                       std::unique_ptr<Executor> heavyExecutor)
    : cfg_(cfg),
      settings_(std::move(settings)),
      light_(std::move(lightExecutor)),
      heavy_(std::move(heavyExecutor)),
      gate_(heavyConcurrency(cfg)) {
    if (cfg_.lightRetries < 0) {
        throw std::invalid_argument("lightRetries must be >= 0 (got " +
                                    std::to_string(cfg_.lightRetries) + ")");
    }
    if (!light_) light_ = makeExecutor(cfg_.parallel, cfg_.cpuWorkers);
    if (!heavy_) heavy_ = makeExecutor(cfg_.parallel, gate_.limit());
}

std::vector<ActionResult> Dispatcher::dispatch(const std::vector<ActionIntent>& batch,
                                               ActorPopulation& population,
                                               const FollowGraph& graph,
                                               const ActionServices& services,
                                               const SlotInfo& slot) {
    const auto t0 = std::chrono::steady_clock::now();
    stats_ = DispatchStats{};
    gate_.resetPeak();

    // Resolve actors up front; at most one intent per actor per slot
    std::vector<ActorRecord*> actors(batch.size(), nullptr);
    std::unordered_set<ActorId> seen;
    seen.reserve(batch.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
        const ActorId id = batch[i].actor;
        if (!seen.insert(id).second) {
            throw std::invalid_argument("actor " + std::to_string(id) +
                                        " has more than one intent in slot " +
                                        std::to_string(slot.slot));
        }
        actors[i] = population.find(id);
        if (!actors[i]) {
            throw std::invalid_argument("intent for unknown actor " + std::to_string(id));
        }
    }

    std::vector<ActionResult> results(batch.size());
    std::vector<std::size_t> light;
    std::vector<std::size_t> heavy;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        (isHeavy(batch[i].kind) ? heavy : light).push_back(i);
    }

    // Heavy intents past the cap plus the queue depth are not run this slot
    const std::size_t admitLimit = gate_.limit() + cfg_.heavyQueueDepth;
    if (heavy.size() > admitLimit) {
        for (std::size_t k = admitLimit; k < heavy.size(); ++k) {
            results[heavy[k]] = skippedResult(batch[heavy[k]]);
        }
        stats_.skipped = heavy.size() - admitLimit;
        heavy.resize(admitLimit);
    }
    stats_.light = light.size();
    stats_.heavy = heavy.size();

    auto runLight = [&] {
        light_->forEach(light.size(), [&](std::size_t k) {
            const std::size_t i = light[k];
            results[i] = execute(batch[i], *actors[i], population, graph, services, slot);
        });
    };
    auto runHeavy = [&] {
        heavy_->forEach(heavy.size(), [&](std::size_t k) {
            const std::size_t i = heavy[k];
            GateSlot hold(gate_);
            results[i] = execute(batch[i], *actors[i], population, graph, services, slot);
        });
    };

    if (cfg_.parallel && !light.empty() && !heavy.empty()) {
        std::exception_ptr heavyError;
        std::thread heavyLane([&] {
            try {
                runHeavy();
            } catch (...) {
                heavyError = std::current_exception();
            }
        });
        runLight();
        heavyLane.join();
        if (heavyError) std::rethrow_exception(heavyError);
    } else {
        runLight();
        runHeavy();
    }

    for (const auto& r : results) {
        if (r.status == ActionStatus::Failed) ++stats_.failed;
    }
    stats_.peakHeavyInFlight = gate_.peak();
    lifetimePeak_ = std::max(lifetimePeak_, stats_.peakHeavyInFlight);
    stats_.wallMs = std::chrono::duration<double, std::milli>(
                        std::chrono::steady_clock::now() - t0).count();
    return results;
}

ActionResult Dispatcher::execute(const ActionIntent& intent, ActorRecord& actor,
                                 const ActorPopulation& population, const FollowGraph& graph,
                                 const ActionServices& services, const SlotInfo& slot) const {
    ActionResult result;
    result.actor = intent.actor;
    result.slot = intent.slot;
    result.kind = intent.kind;

    std::mt19937_64 rng(intentSeed(cfg_.seed, intent));
    const int maxAttempts = traitsOf(intent.kind).idempotent ? 1 + cfg_.lightRetries : 1;
    actor.lastActiveSlot = static_cast<std::int64_t>(slot.slot);

    const auto t0 = std::chrono::steady_clock::now();
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        result.attempts = attempt;
        result.follows.clear();
        result.mentions.clear();
        result.postId.reset();

        ActionContext ctx{services, settings_, population, graph, slot, rng, result};
        try {
            runAction(actor, intent, ctx);
            result.status = ActionStatus::Succeeded;
            result.cause = FailureCause::None;
            result.error.clear();
            break;
        } catch (const GatewayError& e) {
            result.status = ActionStatus::Failed;
            result.cause = e.cause();
            result.error = e.what();
            if (!e.transient()) break;
        } catch (const std::exception& e) {
            result.status = ActionStatus::Failed;
            result.cause = FailureCause::Internal;
            result.error = e.what();
            break;
        }
    }
    result.durationMs = std::chrono::duration<double, std::milli>(
                            std::chrono::steady_clock::now() - t0).count();
    return result;
}
