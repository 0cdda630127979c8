#include "kernel/FollowGraph.h"
#include <algorithm>

namespace {

std::vector<ActorId> sortedIds(const std::unordered_set<ActorId>& set) {
    std::vector<ActorId> ids(set.begin(), set.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace

bool FollowGraph::addEdge(ActorId follower, ActorId followee) {
    if (follower == followee) return false;
    if (!out_[follower].insert(followee).second) return false;
    in_[followee].insert(follower);
    ++edgeCount_;
    return true;
}

bool FollowGraph::removeEdge(ActorId follower, ActorId followee) {
    auto it = out_.find(follower);
    if (it == out_.end() || it->second.erase(followee) == 0) return false;
    if (it->second.empty()) out_.erase(it);

    auto inIt = in_.find(followee);
    if (inIt != in_.end()) {
        inIt->second.erase(follower);
        if (inIt->second.empty()) in_.erase(inIt);
    }
    --edgeCount_;
    return true;
}

bool FollowGraph::hasEdge(ActorId follower, ActorId followee) const {
    auto it = out_.find(follower);
    return it != out_.end() && it->second.count(followee) > 0;
}

std::size_t FollowGraph::removeActor(ActorId id) {
    std::size_t removed = 0;

    // Outgoing edges
    if (auto it = out_.find(id); it != out_.end()) {
        for (ActorId followee : it->second) {
            auto inIt = in_.find(followee);
            if (inIt != in_.end()) {
                inIt->second.erase(id);
                if (inIt->second.empty()) in_.erase(inIt);
            }
            ++removed;
        }
        out_.erase(id);
    }

    // Incoming edges
    if (auto it = in_.find(id); it != in_.end()) {
        for (ActorId follower : it->second) {
            auto outIt = out_.find(follower);
            if (outIt != out_.end()) {
                outIt->second.erase(id);
                if (outIt->second.empty()) out_.erase(outIt);
            }
            ++removed;
        }
        in_.erase(id);
    }

    edgeCount_ -= removed;
    return removed;
}

std::vector<ActorId> FollowGraph::followersOf(ActorId id) const {
    auto it = in_.find(id);
    return it == in_.end() ? std::vector<ActorId>{} : sortedIds(it->second);
}

std::vector<ActorId> FollowGraph::followeesOf(ActorId id) const {
    auto it = out_.find(id);
    return it == out_.end() ? std::vector<ActorId>{} : sortedIds(it->second);
}

std::size_t FollowGraph::followerCount(ActorId id) const {
    auto it = in_.find(id);
    return it == in_.end() ? 0 : it->second.size();
}

std::size_t FollowGraph::followeeCount(ActorId id) const {
    auto it = out_.find(id);
    return it == out_.end() ? 0 : it->second.size();
}

std::vector<FollowEdge> FollowGraph::edges() const {
    std::vector<FollowEdge> result;
    result.reserve(edgeCount_);
    for (const auto& [follower, followees] : out_) {
        for (ActorId followee : followees) {
            result.push_back({follower, followee});
        }
    }
    std::sort(result.begin(), result.end(), [](const FollowEdge& a, const FollowEdge& b) {
        return a.follower != b.follower ? a.follower < b.follower : a.followee < b.followee;
    });
    return result;
}

void FollowGraph::clear() {
    out_.clear();
    in_.clear();
    edgeCount_ = 0;
}
