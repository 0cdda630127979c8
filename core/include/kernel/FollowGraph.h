#ifndef FOLLOW_GRAPH_H
#define FOLLOW_GRAPH_H

#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "kernel/ActionTypes.h"

// Directed follower -> followee edges. Adding an existing edge is a no-op.
class FollowGraph {
public:
    // Returns true if the edge was new. Self-edges are rejected.
    bool addEdge(ActorId follower, ActorId followee);
    bool removeEdge(ActorId follower, ActorId followee);
    bool hasEdge(ActorId follower, ActorId followee) const;

    // Drops every edge incident to the actor. Returns how many were removed.
    std::size_t removeActor(ActorId id);

    std::vector<ActorId> followersOf(ActorId id) const;
    std::vector<ActorId> followeesOf(ActorId id) const;
    std::size_t followerCount(ActorId id) const;
    std::size_t followeeCount(ActorId id) const;

    std::size_t edgeCount() const { return edgeCount_; }
    std::vector<FollowEdge> edges() const;  // sorted by (follower, followee)
    void clear();

private:
    std::unordered_map<ActorId, std::unordered_set<ActorId>> out_;
    std::unordered_map<ActorId, std::unordered_set<ActorId>> in_;
    std::size_t edgeCount_ = 0;
};

#endif
