#include <traitforge/feasibility.hpp>
#include <traitforge/debug_log.hpp>
#include <traitforge/errors.hpp>
#include <limits>
#include <string>
#include <utility>

namespace traitforge {

FeasibilityEstimator::FeasibilityEstimator(const Catalog& catalog, ConstraintSolver& solver,
                                           std::size_t enumeration_budget)
    : catalog_(catalog), solver_(solver), budget_(enumeration_budget) {}

std::optional<std::size_t> FeasibilityEstimator::enumerate_group(const std::vector<std::size_t>& positions,
                                                                 std::size_t& visited) {
    std::vector<std::vector<std::size_t>> domains;
    domains.reserve(positions.size());
    for (std::size_t pos : positions) {
        domains.push_back(solver_.root_domain(pos));
    }

    std::vector<std::pair<std::size_t, std::size_t>> fixed;
    fixed.reserve(positions.size());
    std::size_t count = 0;
    bool exhausted = false;

    // Depth-first over the group's layers, pruning pairs that clash directly
    auto dfs = [&](auto& self, std::size_t depth) -> void {
        if (exhausted) return;
        if (depth == positions.size()) {
            if (++visited > budget_) {
                exhausted = true;
                return;
            }
            if (solver_.satisfiable(fixed)) ++count;
            return;
        }
        std::size_t layer = positions[depth];
        for (std::size_t trait : domains[depth]) {
            bool clash = false;
            for (const auto& [other_layer, other_trait] : fixed) {
                if (!solver_.compatible(layer, trait, other_layer, other_trait)) {
                    clash = true;
                    break;
                }
            }
            if (clash) continue;
            fixed.emplace_back(layer, trait);
            self(self, depth + 1);
            fixed.pop_back();
            if (exhausted) return;
        }
    };
    dfs(dfs, 0);

    if (exhausted) return std::nullopt;
    return count;
}

FeasibilityReport FeasibilityEstimator::estimate() {
    if (cached_) return *cached_;

    FeasibilityReport report;
    if (!solver_.root_consistent()) {
        report.ceiling = 0;
        cached_ = report;
        return report;
    }

    std::size_t bounded_groups = 0;
    for (const auto& group : catalog_.groups()) {
        if (!group.active) continue;
        auto positions = catalog_.group_positions(group);
        if (!positions || positions->empty()) continue;

        bool has_optional = false;
        for (std::size_t pos : *positions) {
            if (catalog_.layer(pos).optional) has_optional = true;
        }
        if (has_optional) continue;

        ++bounded_groups;
        std::size_t visited = 0;
        std::optional<std::size_t> count = enumerate_group(*positions, visited);
        report.enumerated += visited;

        if (!count) {
            // Product of domain sizes, saturating
            std::size_t product = 1;
            for (std::size_t pos : *positions) {
                std::size_t n = solver_.root_domain(pos).size();
                if (n != 0 && product > std::numeric_limits<std::size_t>::max() / n) {
                    product = std::numeric_limits<std::size_t>::max();
                    break;
                }
                product *= n;
            }
            count = product;
            report.exact = false;
            TRAITFORGE_DEBUG("Group %u exceeded enumeration budget, bounding by %zu", group.id, product);
        }

        if (!report.ceiling || *count < *report.ceiling) {
            report.ceiling = count;
            report.limiting_group = group.id;
        }
    }

    // Several groups can interact, so their minimum is only a bound
    if (bounded_groups > 1) report.exact = false;

    // Arc consistency can hold with no full solution; enumerated ceilings
    // already imply one, anything else needs a search
    if (!report.ceiling || !report.exact) {
        if (!solver_.satisfiable({})) {
            TRAITFORGE_DEBUG("Rules admit no complete assignment");
            report.ceiling = 0;
            report.exact = true;
            report.limiting_group.reset();
        }
    }

    cached_ = report;
    return report;
}

void FeasibilityEstimator::check(std::size_t count) {
    if (count == 0) return;

    FeasibilityReport report = estimate();
    if (!report.ceiling || count <= *report.ceiling) return;

    if (*report.ceiling == 0) {
        throw FeasibilityError("No combination satisfies the compatibility rules", 0);
    }
    throw FeasibilityError("Requested " + std::to_string(count) + " items but at most " +
                               std::to_string(*report.ceiling) +
                               " unique combinations are possible",
                           *report.ceiling);
}

} // namespace traitforge
