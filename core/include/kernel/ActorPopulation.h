#ifndef ACTOR_POPULATION_H
#define ACTOR_POPULATION_H

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>
#include "kernel/Actor.h"

/**
 * Owns every actor ever created, live or churned.
 *
 * Ids are allocated monotonically and never reused. Records are only added
 * or churned between slots, so references handed to a slot's workers stay
 * valid until the slot drains.
 */
class ActorPopulation {
public:
    ActorId allocateId() { return nextId_++; }
    ActorId peekNextId() const { return nextId_; }
    // Never hand out ids below next (ids of actors dropped from a snapshot).
    void reserveIds(ActorId next) {
        if (next > nextId_) nextId_ = next;
    }

    // Takes ownership of a record whose id was allocated here (or restored
    // from a snapshot). Throws std::invalid_argument on a duplicate id.
    ActorRecord& add(ActorRecord actor);

    // Records the id the content service assigned after registration.
    void assignServiceId(ActorId id, std::int64_t serviceId);

    // Marks an actor churned. Returns false if it was not live.
    bool churn(ActorId id, std::int64_t slot);

    ActorRecord* find(ActorId id);
    const ActorRecord* find(ActorId id) const;
    ActorRecord& at(ActorId id);
    const ActorRecord& at(ActorId id) const;
    const ActorRecord* findByServiceId(std::int64_t serviceId) const;
    const ActorRecord* findByName(const std::string& name) const;

    // Live ids in ascending order; the slot works on this snapshot.
    std::vector<ActorId> liveIds() const;
    std::vector<ActorId> liveIds(ActorKind kind) const;

    std::size_t liveCount() const { return liveCount_; }
    std::size_t liveCount(ActorKind kind) const;
    std::size_t totalCount() const { return actors_.size(); }
    std::size_t churnedCount() const { return actors_.size() - liveCount_; }

    const std::vector<ActorRecord>& all() const { return actors_; }
    void clear();

private:
    std::vector<ActorRecord> actors_;
    std::unordered_map<ActorId, std::size_t> index_;
    std::unordered_map<std::int64_t, std::size_t> serviceIndex_;
    ActorId nextId_ = 0;
    std::size_t liveCount_ = 0;
};

#endif
