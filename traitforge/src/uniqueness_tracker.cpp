#include <traitforge/uniqueness_tracker.hpp>
#include <traitforge/debug_log.hpp>

namespace traitforge {

UniquenessTracker::UniquenessTracker(const Catalog& catalog)
    : catalog_(catalog), by_layer_(catalog.layer_count()) {
    const auto& groups = catalog_.groups();
    groups_.resize(groups.size());

    for (std::size_t g = 0; g < groups.size(); ++g) {
        auto positions = catalog_.group_positions(groups[g]);
        if (!groups[g].active || !positions || positions->empty()) {
            continue;
        }
        groups_[g].enforced = true;
        groups_[g].positions = std::move(*positions);
        for (std::size_t pos : groups_[g].positions) {
            by_layer_[pos].push_back(g);
        }
    }
}

bool UniquenessTracker::covers(std::size_t group_index, const Assignment& assignment) const {
    const auto& state = groups_[group_index];
    if (!state.enforced) return false;
    for (std::size_t pos : state.positions) {
        if (!assignment.is_assigned(pos)) return false;
    }
    return true;
}

std::optional<CombinationKey> UniquenessTracker::key_for(std::size_t group_index,
                                                         const Assignment& assignment) const {
    if (!covers(group_index, assignment)) return std::nullopt;
    return CombinationKey::from_ids(catalog_.selected_ids(assignment, groups_[group_index].positions));
}

bool UniquenessTracker::check(std::size_t group_index, const Assignment& assignment) const {
    auto key = key_for(group_index, assignment);
    if (!key) return true;
    return groups_[group_index].used.count(*key) == 0;
}

bool UniquenessTracker::check_all(const Assignment& assignment) const {
    for (std::size_t g = 0; g < groups_.size(); ++g) {
        if (!check(g, assignment)) return false;
    }
    return true;
}

void UniquenessTracker::commit(const Assignment& assignment) {
    for (std::size_t g = 0; g < groups_.size(); ++g) {
        auto key = key_for(g, assignment);
        if (!key) continue;
        if (groups_[g].used.insert(*key).second && !key->is_exact()) {
            ++approximate_keys_;
        }
    }
    TRAITFORGE_DEBUG("Committed assignment across %zu groups", groups_.size());
}

void UniquenessTracker::clear() {
    for (auto& state : groups_) {
        state.used.clear();
    }
    approximate_keys_ = 0;
}

} // namespace traitforge
