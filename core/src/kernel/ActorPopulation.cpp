#include "kernel/ActorPopulation.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

const char* actorKindName(ActorKind kind) {
    return kind == ActorKind::Page ? "page" : "user";
}

ActorRecord& ActorPopulation::add(ActorRecord actor) {
    if (index_.count(actor.id)) {
        throw std::invalid_argument("duplicate actor id " + std::to_string(actor.id));
    }
    // Restored snapshots carry their own ids; keep the allocator ahead of them.
    if (actor.id >= nextId_) nextId_ = actor.id + 1;

    const std::size_t pos = actors_.size();
    index_[actor.id] = pos;
    if (actor.serviceId >= 0) serviceIndex_[actor.serviceId] = pos;
    if (actor.live()) ++liveCount_;
    actors_.push_back(std::move(actor));
    return actors_.back();
}

void ActorPopulation::assignServiceId(ActorId id, std::int64_t serviceId) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("unknown actor id " + std::to_string(id));
    }
    ActorRecord& actor = actors_[it->second];
    if (actor.serviceId >= 0) serviceIndex_.erase(actor.serviceId);
    actor.serviceId = serviceId;
    if (serviceId >= 0) serviceIndex_[serviceId] = it->second;
}

bool ActorPopulation::churn(ActorId id, std::int64_t slot) {
    ActorRecord* actor = find(id);
    if (!actor || !actor->live()) return false;
    actor->lifecycle = Lifecycle::Churned;
    actor->churnedOnSlot = slot;
    actor->pendingMentions.clear();
    --liveCount_;
    return true;
}

ActorRecord* ActorPopulation::find(ActorId id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &actors_[it->second];
}

const ActorRecord* ActorPopulation::find(ActorId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &actors_[it->second];
}

ActorRecord& ActorPopulation::at(ActorId id) {
    ActorRecord* actor = find(id);
    if (!actor) throw std::out_of_range("unknown actor id " + std::to_string(id));
    return *actor;
}

const ActorRecord& ActorPopulation::at(ActorId id) const {
    const ActorRecord* actor = find(id);
    if (!actor) throw std::out_of_range("unknown actor id " + std::to_string(id));
    return *actor;
}

const ActorRecord* ActorPopulation::findByServiceId(std::int64_t serviceId) const {
    auto it = serviceIndex_.find(serviceId);
    return it == serviceIndex_.end() ? nullptr : &actors_[it->second];
}

const ActorRecord* ActorPopulation::findByName(const std::string& name) const {
    for (const auto& actor : actors_) {
        if (actor.profile.name == name) return &actor;
    }
    return nullptr;
}

std::vector<ActorId> ActorPopulation::liveIds() const {
    std::vector<ActorId> ids;
    ids.reserve(liveCount_);
    for (const auto& actor : actors_) {
        if (actor.live()) ids.push_back(actor.id);
    }
    // Snapshots may be restored out of id order
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<ActorId> ActorPopulation::liveIds(ActorKind kind) const {
    std::vector<ActorId> ids;
    for (const auto& actor : actors_) {
        if (actor.live() && actor.kind == kind) ids.push_back(actor.id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t ActorPopulation::liveCount(ActorKind kind) const {
    std::size_t n = 0;
    for (const auto& actor : actors_) {
        if (actor.live() && actor.kind == kind) ++n;
    }
    return n;
}

void ActorPopulation::clear() {
    actors_.clear();
    index_.clear();
    serviceIndex_.clear();
    nextId_ = 0;
    liveCount_ = 0;
}
