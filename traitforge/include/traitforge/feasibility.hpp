#ifndef TRAITFORGE_FEASIBILITY_HPP
#define TRAITFORGE_FEASIBILITY_HPP

#include <traitforge/catalog.hpp>
#include <traitforge/constraint_solver.hpp>
#include <cstddef>
#include <optional>

namespace traitforge {

struct FeasibilityReport {
    std::optional<std::size_t> ceiling;     // nullopt when nothing bounds the count
    bool exact = true;                      // False when the ceiling is only an upper bound
    std::optional<GroupId> limiting_group;
    std::size_t enumerated = 0;             // Tuples visited
};

/**
 * Upper bound on how many artifacts a run can produce before the uniqueness
 * groups run out of fresh tuples.
 *
 * Each active group is enumerated over the root-consistent domains of its
 * layers; a tuple counts when it extends to a full valid assignment. A group
 * containing an optional layer is unbounded, since skipping that layer frees
 * the group. Past the enumeration budget the group falls back to the product
 * of its domain sizes. The result is deterministic for a given catalog.
 */
class FeasibilityEstimator {
public:
    FeasibilityEstimator(const Catalog& catalog, ConstraintSolver& solver,
                         std::size_t enumeration_budget = 100000);

    FeasibilityReport estimate();

    /**
     * @throws FeasibilityError when count exceeds the ceiling
     */
    void check(std::size_t count);

private:
    // nullopt when the budget ran out
    std::optional<std::size_t> enumerate_group(const std::vector<std::size_t>& positions,
                                               std::size_t& visited);

    const Catalog& catalog_;
    ConstraintSolver& solver_;
    std::size_t budget_;
    std::optional<FeasibilityReport> cached_;
};

} // namespace traitforge

#endif // TRAITFORGE_FEASIBILITY_HPP
