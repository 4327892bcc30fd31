#include <traitforge/constraint_solver.hpp>
#include <traitforge/debug_log.hpp>
#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>

namespace traitforge {

ConstraintSolver::ConstraintSolver(const Catalog& catalog, SolverOptions options)
    : catalog_(catalog),
      options_(options),
      layer_count_(catalog.layer_count()),
      arc_index_(catalog.layer_count() * catalog.layer_count(), -1),
      incoming_(catalog.layer_count()),
      degree_(catalog.layer_count(), 0),
      root_assignment_(catalog.layer_count()),
      dead_ends_(CacheLimits{options.memo_capacity, 0},
                 std::make_unique<FifoPolicy<std::string>>()),
      rng_(options.seed ? *options.seed : std::random_device{}()) {

    root_.alive.resize(layer_count_);
    root_.size.resize(layer_count_);
    for (std::size_t l = 0; l < layer_count_; ++l) {
        std::size_t n = catalog_.layer(l).traits.size();
        root_.alive[l].assign(n, 1);
        root_.size[l] = n;
    }

    build_arcs();

    // Degree counts constraint neighbours plus uniqueness groups, used for MRV ties
    for (const auto& group : catalog_.groups()) {
        if (!group.active) continue;
        if (auto positions = catalog_.group_positions(group)) {
            for (std::size_t pos : *positions) ++degree_[pos];
        }
    }

    root_consistent_ = propagate(root_assignment_, root_);
    TRAITFORGE_DEBUG("Solver built: %zu layers, %zu arcs, root %s",
                     layer_count_, arcs_.size(), root_consistent_ ? "consistent" : "inconsistent");
}

void ConstraintSolver::build_arcs() {
    // Mark every layer pair linked by a rule in either direction
    std::vector<std::uint8_t> linked(layer_count_ * layer_count_, 0);
    for (std::size_t l = 0; l < layer_count_; ++l) {
        for (const auto& trait : catalog_.layer(l).traits) {
            if (!trait.is_ruler()) continue;
            for (const auto& rule : trait.rules) {
                auto target = catalog_.layer_position(rule.target_layer);
                if (!target || *target == l) continue;
                linked[l * layer_count_ + *target] = 1;
                linked[*target * layer_count_ + l] = 1;
            }
        }
    }

    for (std::size_t a = 0; a < layer_count_; ++a) {
        for (std::size_t b = 0; b < layer_count_; ++b) {
            if (!linked[a * layer_count_ + b]) continue;

            const Layer& la = catalog_.layer(a);
            const Layer& lb = catalog_.layer(b);
            Arc arc{a, b, std::vector<std::uint8_t>(la.traits.size() * lb.traits.size(), 1)};

            for (std::size_t i = 0; i < la.traits.size(); ++i) {
                const CompatibilityRule* forward = la.traits[i].rule_for(lb.id);
                for (std::size_t j = 0; j < lb.traits.size(); ++j) {
                    const CompatibilityRule* backward = lb.traits[j].rule_for(la.id);
                    bool ok = (!forward || forward->permits(lb.traits[j].id)) &&
                              (!backward || backward->permits(la.traits[i].id));
                    arc.table[i * lb.traits.size() + j] = ok ? 1 : 0;
                }
            }

            arc_index_[a * layer_count_ + b] = static_cast<int>(arcs_.size());
            incoming_[b].push_back(arcs_.size());
            ++degree_[a];
            arcs_.push_back(std::move(arc));
        }
    }
}

bool ConstraintSolver::compatible(std::size_t layer_a, std::size_t trait_a,
                                  std::size_t layer_b, std::size_t trait_b) const {
    int idx = arc_index_[layer_a * layer_count_ + layer_b];
    if (idx < 0) return true;
    const Arc& arc = arcs_[static_cast<std::size_t>(idx)];
    return arc.table[trait_a * catalog_.layer(layer_b).traits.size() + trait_b] != 0;
}

bool ConstraintSolver::revise(const Arc& arc, Domains& domains) {
    ++stats_.revisions;
    auto& from = domains.alive[arc.from];
    const auto& to = domains.alive[arc.to];
    std::size_t to_count = to.size();
    bool changed = false;

    for (std::size_t i = 0; i < from.size(); ++i) {
        if (!from[i]) continue;
        bool supported = false;
        for (std::size_t j = 0; j < to_count; ++j) {
            if (to[j] && arc.table[i * to_count + j]) {
                supported = true;
                break;
            }
        }
        if (!supported) {
            from[i] = 0;
            --domains.size[arc.from];
            changed = true;
        }
    }
    return changed;
}

bool ConstraintSolver::propagate(Assignment& assignment, Domains& domains) {
    std::deque<std::size_t> queue;
    std::vector<std::uint8_t> queued(arcs_.size(), 1);
    for (std::size_t i = 0; i < arcs_.size(); ++i) queue.push_back(i);

    while (!queue.empty()) {
        std::size_t idx = queue.front();
        queue.pop_front();
        queued[idx] = 0;
        const Arc& arc = arcs_[idx];

        // A skipped layer, or an optional layer that may still be skipped,
        // supports every value on the other side
        if (assignment.is_skipped(arc.from) || assignment.is_skipped(arc.to)) continue;
        if (catalog_.layer(arc.to).optional && !assignment.is_decided(arc.to)) continue;

        if (!revise(arc, domains)) continue;

        if (domains.size[arc.from] == 0) {
            if (catalog_.layer(arc.from).optional && !assignment.is_decided(arc.from)) {
                assignment.choice[arc.from] = Assignment::SKIPPED;
                continue;
            }
            return false;
        }

        for (std::size_t in : incoming_[arc.from]) {
            if (arcs_[in].from == arc.to || queued[in]) continue;
            queued[in] = 1;
            queue.push_back(in);
        }
    }
    return true;
}

std::optional<std::size_t> ConstraintSolver::select_layer(const Assignment& assignment,
                                                          const Domains& domains) const {
    std::optional<std::size_t> best;
    std::size_t best_size = std::numeric_limits<std::size_t>::max();

    for (std::size_t l = 0; l < layer_count_; ++l) {
        if (assignment.is_decided(l)) continue;
        std::size_t effective = domains.size[l] + (catalog_.layer(l).optional ? 1 : 0);
        if (!best || effective < best_size ||
            (effective == best_size && degree_[l] > degree_[*best])) {
            best = l;
            best_size = effective;
        }
    }
    return best;
}

std::vector<std::int32_t> ConstraintSolver::order_options(std::size_t layer, const Domains& domains,
                                                          SearchContext& ctx) {
    const auto& traits = catalog_.layer(layer).traits;
    std::vector<std::int32_t> values;
    values.reserve(domains.size[layer] + 1);
    for (std::size_t t = 0; t < traits.size(); ++t) {
        if (domains.alive[layer][t]) values.push_back(static_cast<std::int32_t>(t));
    }

    auto weight_of = [&traits](std::int32_t t) { return traits[static_cast<std::size_t>(t)].rarity_weight; };

    switch (ctx.order) {
        case CandidateOrder::WeightedRandom: {
            // Efraimidis-Spirakis: key = log(u) / w, largest key first
            std::uniform_real_distribution<double> uniform(0.0, 1.0);
            std::vector<std::pair<double, std::int32_t>> keyed;
            keyed.reserve(values.size());
            for (std::int32_t v : values) {
                double u = uniform(rng_);
                if (u <= 0.0) u = std::numeric_limits<double>::min();
                keyed.emplace_back(std::log(u) / weight_of(v), v);
            }
            std::sort(keyed.begin(), keyed.end(),
                      [](const auto& a, const auto& b) { return a.first > b.first; });
            for (std::size_t i = 0; i < keyed.size(); ++i) values[i] = keyed[i].second;
            break;
        }
        case CandidateOrder::WeightTiers: {
            std::shuffle(values.begin(), values.end(), rng_);
            std::stable_sort(values.begin(), values.end(),
                             [&](std::int32_t a, std::int32_t b) { return weight_of(a) > weight_of(b); });
            break;
        }
        case CandidateOrder::Deterministic:
            std::stable_sort(values.begin(), values.end(),
                             [&](std::int32_t a, std::int32_t b) { return weight_of(a) > weight_of(b); });
            break;
    }

    if (catalog_.layer(layer).optional) {
        bool fill_first = false;
        if (ctx.randomize_optional && options_.optional_fill_probability > 0.0) {
            std::bernoulli_distribution coin(std::min(1.0, options_.optional_fill_probability));
            fill_first = coin(rng_);
        }
        if (fill_first) {
            values.push_back(Assignment::SKIPPED);
        } else {
            values.insert(values.begin(), Assignment::SKIPPED);
        }
    }
    return values;
}

bool ConstraintSolver::groups_satisfied(std::size_t layer, const Assignment& assignment,
                                        const SearchContext& ctx) const {
    if (!ctx.tracker) return true;
    for (std::size_t g : ctx.tracker->groups_for_layer(layer)) {
        if (!ctx.tracker->check(g, assignment)) return false;
    }
    return true;
}

std::string ConstraintSolver::memo_key(const Assignment& assignment) {
    std::string key;
    key.reserve(assignment.size() * sizeof(std::int32_t));
    for (std::int32_t c : assignment.choice) {
        key.append(reinterpret_cast<const char*>(&c), sizeof(c));
    }
    return key;
}

std::optional<Assignment> ConstraintSolver::search(const Assignment& assignment, const Domains& domains,
                                                   SearchContext& ctx) {
    if (++ctx.nodes > options_.max_nodes) {
        ctx.budget_exhausted = true;
        return std::nullopt;
    }
    ++stats_.nodes;

    auto layer = select_layer(assignment, domains);
    if (!layer) {
        if (ctx.tracker && !ctx.tracker->check_all(assignment)) return std::nullopt;
        return assignment;
    }

    std::string key;
    if (ctx.use_memo) {
        key = memo_key(assignment);
        if (dead_ends_.contains(key)) {
            ++stats_.memo_hits;
            return std::nullopt;
        }
    }

    for (std::int32_t option : order_options(*layer, domains, ctx)) {
        Assignment next = assignment;
        Domains next_domains = domains;

        next.choice[*layer] = option;
        if (option != Assignment::SKIPPED) {
            auto& alive = next_domains.alive[*layer];
            std::fill(alive.begin(), alive.end(), 0);
            alive[static_cast<std::size_t>(option)] = 1;
            next_domains.size[*layer] = 1;
        }

        if (!propagate(next, next_domains)) continue;
        if (option != Assignment::SKIPPED && !groups_satisfied(*layer, next, ctx)) continue;

        if (auto found = search(next, next_domains, ctx)) {
            return found;
        }
        if (ctx.budget_exhausted) return std::nullopt;
    }

    ++stats_.backtracks;
    if (ctx.use_memo) {
        dead_ends_.put(key, true);
    }
    return std::nullopt;
}

std::optional<Assignment> ConstraintSolver::solve(const UniquenessTracker* tracker) {
    ++stats_.solves;
    if (!root_consistent_) {
        ++stats_.failures;
        return std::nullopt;
    }

    SearchContext ctx;
    ctx.tracker = tracker;
    ctx.order = options_.order;
    ctx.use_memo = options_.memo_capacity > 0;
    ctx.randomize_optional = true;

    auto result = search(root_assignment_, root_, ctx);
    if (!result) {
        ++stats_.failures;
        if (ctx.budget_exhausted) {
            ++stats_.budget_exhaustions;
            TRAITFORGE_DEBUG("Solve abandoned after %zu nodes", ctx.nodes);
        }
    }
    return result;
}

bool ConstraintSolver::satisfiable(const std::vector<std::pair<std::size_t, std::size_t>>& fixed) {
    if (!root_consistent_) return false;

    Assignment assignment = root_assignment_;
    Domains domains = root_;
    for (const auto& [layer, trait] : fixed) {
        if (layer >= layer_count_ || trait >= domains.alive[layer].size()) return false;
        if (!domains.alive[layer][trait] || assignment.is_skipped(layer)) return false;
        auto& alive = domains.alive[layer];
        std::fill(alive.begin(), alive.end(), 0);
        alive[trait] = 1;
        domains.size[layer] = 1;
        assignment.choice[layer] = static_cast<std::int32_t>(trait);
    }
    if (!propagate(assignment, domains)) return false;

    SearchContext ctx;
    ctx.order = CandidateOrder::Deterministic;
    auto found = search(assignment, domains, ctx);
    if (!found && ctx.budget_exhausted) {
        TRAITFORGE_DEBUG("Satisfiability check ran out of budget, assuming satisfiable");
        return true;
    }
    return found.has_value();
}

bool ConstraintSolver::is_valid(const Assignment& assignment) const {
    if (assignment.size() != layer_count_) return false;

    for (std::size_t l = 0; l < layer_count_; ++l) {
        std::int32_t c = assignment.choice[l];
        if (c == Assignment::UNASSIGNED) return false;
        if (c == Assignment::SKIPPED) {
            if (!catalog_.layer(l).optional) return false;
            continue;
        }
        if (c < 0 || static_cast<std::size_t>(c) >= catalog_.layer(l).traits.size()) return false;
    }

    for (const auto& arc : arcs_) {
        if (!assignment.is_assigned(arc.from) || !assignment.is_assigned(arc.to)) continue;
        if (!compatible(arc.from, static_cast<std::size_t>(assignment.choice[arc.from]),
                        arc.to, static_cast<std::size_t>(assignment.choice[arc.to]))) {
            return false;
        }
    }
    return true;
}

bool ConstraintSolver::exclude_trait(TraitId id) {
    auto pos = catalog_.trait_position(id);
    if (!pos) return false;
    auto& alive = root_.alive[pos->layer];
    if (!alive[pos->trait]) return false;

    alive[pos->trait] = 0;
    --root_.size[pos->layer];

    if (root_.size[pos->layer] == 0 && catalog_.layer(pos->layer).optional) {
        root_assignment_.choice[pos->layer] = Assignment::SKIPPED;
    } else if (root_.size[pos->layer] == 0) {
        root_consistent_ = false;
    }
    if (root_consistent_) {
        root_consistent_ = propagate(root_assignment_, root_);
    }
    TRAITFORGE_WARN("Excluded trait %u from further selection%s", id,
                    root_consistent_ ? "" : ", catalog is no longer satisfiable");
    return true;
}

std::vector<std::size_t> ConstraintSolver::root_domain(std::size_t layer) const {
    std::vector<std::size_t> result;
    if (root_assignment_.is_skipped(layer)) return result;
    for (std::size_t t = 0; t < root_.alive[layer].size(); ++t) {
        if (root_.alive[layer][t]) result.push_back(t);
    }
    return result;
}

void ConstraintSolver::reset() {
    dead_ends_.clear();
    stats_ = SolverStats{};
}

} // namespace traitforge
