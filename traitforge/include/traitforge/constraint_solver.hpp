#ifndef TRAITFORGE_CONSTRAINT_SOLVER_HPP
#define TRAITFORGE_CONSTRAINT_SOLVER_HPP

#include <traitforge/cache.hpp>
#include <traitforge/catalog.hpp>
#include <traitforge/uniqueness_tracker.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace traitforge {

enum class CandidateOrder {
    WeightedRandom,   // Weighted sampling without replacement
    WeightTiers,      // Strict weight descending, ties shuffled
    Deterministic     // Strict weight descending, catalog order among ties
};

struct SolverOptions {
    CandidateOrder order = CandidateOrder::WeightTiers;
    double optional_fill_probability = 0.0;  // Chance an optional layer tries its traits before skipping
    std::size_t memo_capacity = 1000;        // Dead-end entries kept (FIFO)
    std::size_t max_nodes = 200000;          // Search nodes per solve
    std::optional<std::uint64_t> seed;
};

struct SolverStats {
    std::size_t solves = 0;
    std::size_t failures = 0;
    std::size_t nodes = 0;
    std::size_t backtracks = 0;
    std::size_t memo_hits = 0;
    std::size_t revisions = 0;
    std::size_t budget_exhaustions = 0;
};

/**
 * Trait-selection solver: arc consistency (AC-3) maintained during a
 * most-constrained-first backtracking search.
 *
 * The constraint graph has an arc between two layers whenever a ruler trait
 * on either one has a rule targeting the other. Compatibility of a trait pair
 * is checked in both directions, so a rule only needs to be declared on one
 * side. Skipping an optional layer always satisfies every arc touching it.
 *
 * Dead ends are memoized for the solver's lifetime. This is sound for one run
 * because the tracker only grows and excluded traits never come back; build a
 * new solver (or call reset()) when the tracker is cleared.
 */
class ConstraintSolver {
public:
    ConstraintSolver(const Catalog& catalog, SolverOptions options = {});

    /**
     * Find one complete assignment that satisfies every rule and, if a tracker
     * is given, every active uniqueness group.
     * @return nullopt when no such assignment exists or the node budget ran out
     */
    std::optional<Assignment> solve(const UniquenessTracker* tracker = nullptr);

    /**
     * Deterministic existence check with some layers pinned, ignoring
     * uniqueness. Budget exhaustion answers true.
     * @param fixed pairs of (layer position, trait position)
     */
    bool satisfiable(const std::vector<std::pair<std::size_t, std::size_t>>& fixed);

    // Full rule check of a complete assignment
    bool is_valid(const Assignment& assignment) const;

    bool compatible(std::size_t layer_a, std::size_t trait_a,
                    std::size_t layer_b, std::size_t trait_b) const;

    /**
     * Remove a trait from consideration for the rest of this solver's life.
     * @return false if the trait is unknown or already excluded
     */
    bool exclude_trait(TraitId id);

    // Whether the catalog admits any assignment at all after root propagation
    bool root_consistent() const { return root_consistent_; }

    // Trait positions of a layer that survive root propagation
    std::vector<std::size_t> root_domain(std::size_t layer) const;

    bool connected(std::size_t layer_a, std::size_t layer_b) const {
        return arc_index_[layer_a * layer_count_ + layer_b] >= 0;
    }

    void reset();

    const SolverStats& stats() const { return stats_; }
    const SolverOptions& options() const { return options_; }

private:
    struct Domains {
        std::vector<std::vector<std::uint8_t>> alive;
        std::vector<std::size_t> size;
    };

    struct Arc {
        std::size_t from;
        std::size_t to;
        std::vector<std::uint8_t> table;   // [i * to_count + j] = compatible
    };

    struct SearchContext {
        const UniquenessTracker* tracker = nullptr;
        CandidateOrder order = CandidateOrder::WeightTiers;
        bool use_memo = false;
        bool randomize_optional = false;
        std::size_t nodes = 0;
        bool budget_exhausted = false;
    };

    void build_arcs();
    bool propagate(Assignment& assignment, Domains& domains);
    bool revise(const Arc& arc, Domains& domains);
    std::optional<std::size_t> select_layer(const Assignment& assignment, const Domains& domains) const;
    std::vector<std::int32_t> order_options(std::size_t layer, const Domains& domains, SearchContext& ctx);
    bool groups_satisfied(std::size_t layer, const Assignment& assignment, const SearchContext& ctx) const;
    std::optional<Assignment> search(const Assignment& assignment, const Domains& domains, SearchContext& ctx);
    static std::string memo_key(const Assignment& assignment);

    const Catalog& catalog_;
    SolverOptions options_;
    std::size_t layer_count_;
    std::vector<Arc> arcs_;
    std::vector<int> arc_index_;                          // [from * layer_count + to] -> arcs_ or -1
    std::vector<std::vector<std::size_t>> incoming_;       // Arc indices ending at a layer
    std::vector<std::size_t> degree_;
    Assignment root_assignment_;                           // Undecided except forced skips
    Domains root_;
    bool root_consistent_ = true;
    Cache<std::string, bool> dead_ends_;
    std::mt19937_64 rng_;
    SolverStats stats_;
};

} // namespace traitforge

#endif // TRAITFORGE_CONSTRAINT_SOLVER_HPP
