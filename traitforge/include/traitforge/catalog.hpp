#ifndef TRAITFORGE_CATALOG_HPP
#define TRAITFORGE_CATALOG_HPP

#include <traitforge/types.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace traitforge {

struct TraitPosition {
    std::size_t layer;
    std::size_t trait;
};

/**
 * Read-only indexed view over a request's layers and uniqueness groups.
 * Layers are addressed by catalog position (their index in the request),
 * traits by position within their layer.
 */
class Catalog {
public:
    explicit Catalog(std::shared_ptr<const GenerationRequest> request);

    /**
     * Check the structural invariants the solver and tracker rely on.
     * Non-fatal oddities (rules or groups naming unknown layers) are logged.
     * @throws ValidationError on the first violation found
     */
    void validate() const;

    const GenerationRequest& request() const { return *request_; }
    std::shared_ptr<const GenerationRequest> shared_request() const { return request_; }

    std::size_t layer_count() const { return request_->layers.size(); }
    const Layer& layer(std::size_t position) const { return request_->layers[position]; }
    const Trait& trait(std::size_t layer, std::size_t trait) const {
        return request_->layers[layer].traits[trait];
    }
    std::size_t trait_count() const { return trait_count_; }

    std::optional<std::size_t> layer_position(LayerId id) const;
    std::optional<TraitPosition> trait_position(TraitId id) const;

    const std::vector<UniquenessGroup>& groups() const { return request_->groups; }

    /**
     * Catalog positions of the group's layers, or nullopt if the group names a
     * layer the catalog doesn't have (such a group can never be covered).
     */
    std::optional<std::vector<std::size_t>> group_positions(const UniquenessGroup& group) const;

    // Layer positions sorted by stacking order, catalog order breaking ties
    const std::vector<std::size_t>& stacking_order() const { return stacking_order_; }

    // Trait ids of the assigned layers, in catalog order
    std::vector<TraitId> selected_ids(const Assignment& assignment,
                                      const std::vector<std::size_t>& positions) const;

    std::size_t rule_count() const { return rule_count_; }
    std::size_t max_rules_per_trait() const { return max_rules_per_trait_; }

private:
    std::shared_ptr<const GenerationRequest> request_;
    std::unordered_map<LayerId, std::size_t> layer_index_;
    std::unordered_map<TraitId, TraitPosition> trait_index_;
    std::vector<std::size_t> stacking_order_;
    std::size_t trait_count_ = 0;
    std::size_t rule_count_ = 0;
    std::size_t max_rules_per_trait_ = 0;
};

} // namespace traitforge

#endif // TRAITFORGE_CATALOG_HPP
