#ifndef TRAITFORGE_UNIQUENESS_TRACKER_HPP
#define TRAITFORGE_UNIQUENESS_TRACKER_HPP

#include <traitforge/catalog.hpp>
#include <traitforge/combination_key.hpp>
#include <cstddef>
#include <optional>
#include <unordered_set>
#include <vector>

namespace traitforge {

/**
 * Remembers, per uniqueness group, which trait tuples a run has already used.
 *
 * A group only constrains an assignment once every one of its layers holds a
 * trait; a skipped or undecided member layer leaves the group unconstrained.
 * Owned by a single run, so there is no locking.
 */
class UniquenessTracker {
public:
    explicit UniquenessTracker(const Catalog& catalog);

    /**
     * @param group_index index into catalog.groups()
     * @return true if the assignment is acceptable for this group
     */
    bool check(std::size_t group_index, const Assignment& assignment) const;

    // check() over every group
    bool check_all(const Assignment& assignment) const;

    // Whether group_index has all of its layers assigned in the assignment
    bool covers(std::size_t group_index, const Assignment& assignment) const;

    // Key the group would record for this assignment, if covered
    std::optional<CombinationKey> key_for(std::size_t group_index, const Assignment& assignment) const;

    /**
     * Record the assignment in every active, covered group. Call only once the
     * artifact has been produced.
     */
    void commit(const Assignment& assignment);

    void clear();

    std::size_t group_count() const { return groups_.size(); }
    std::size_t used_count(std::size_t group_index) const { return groups_[group_index].used.size(); }
    std::size_t approximate_key_count() const { return approximate_keys_; }

    // Group indices (into catalog.groups()) that include the given layer position
    const std::vector<std::size_t>& groups_for_layer(std::size_t layer) const { return by_layer_[layer]; }

private:
    struct GroupState {
        bool enforced = false;                 // Active and fully present in the catalog
        std::vector<std::size_t> positions;
        std::unordered_set<CombinationKey> used;
    };

    const Catalog& catalog_;
    std::vector<GroupState> groups_;
    std::vector<std::vector<std::size_t>> by_layer_;
    std::size_t approximate_keys_ = 0;
};

} // namespace traitforge

#endif // TRAITFORGE_UNIQUENESS_TRACKER_HPP
