#include <traitforge/catalog.hpp>
#include <traitforge/debug_log.hpp>
#include <traitforge/errors.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>

namespace traitforge {

bool CompatibilityRule::permits(TraitId trait) const {
    if (std::find(forbidden.begin(), forbidden.end(), trait) != forbidden.end()) {
        return false;
    }
    if (allowed.empty()) {
        return true;
    }
    return std::find(allowed.begin(), allowed.end(), trait) != allowed.end();
}

const CompatibilityRule* Trait::rule_for(LayerId layer) const {
    if (!is_ruler()) return nullptr;
    for (const auto& rule : rules) {
        if (rule.target_layer == layer) return &rule;
    }
    return nullptr;
}

Catalog::Catalog(std::shared_ptr<const GenerationRequest> request)
    : request_(std::move(request)) {
    if (!request_) {
        throw std::invalid_argument("Catalog requires a request");
    }

    const auto& layers = request_->layers;
    for (std::size_t l = 0; l < layers.size(); ++l) {
        // First occurrence wins; validate() reports duplicates
        layer_index_.emplace(layers[l].id, l);
        for (std::size_t t = 0; t < layers[l].traits.size(); ++t) {
            const Trait& trait = layers[l].traits[t];
            trait_index_.emplace(trait.id, TraitPosition{l, t});
            ++trait_count_;
            if (trait.is_ruler()) {
                rule_count_ += trait.rules.size();
                max_rules_per_trait_ = std::max(max_rules_per_trait_, trait.rules.size());
            }
        }
    }

    stacking_order_.resize(layers.size());
    for (std::size_t i = 0; i < layers.size(); ++i) stacking_order_[i] = i;
    std::stable_sort(stacking_order_.begin(), stacking_order_.end(),
                     [&layers](std::size_t a, std::size_t b) {
                         return layers[a].order < layers[b].order;
                     });
}

void Catalog::validate() const {
    const auto& req = *request_;

    if (req.output.width == 0 || req.output.height == 0) {
        throw ValidationError("Output dimensions must be positive, got " +
                              std::to_string(req.output.width) + "x" +
                              std::to_string(req.output.height));
    }
    if (req.layers.empty()) {
        throw ValidationError("Catalog has no layers");
    }

    std::unordered_set<LayerId> layer_ids;
    std::unordered_set<TraitId> trait_ids;
    for (const auto& layer : req.layers) {
        if (!layer_ids.insert(layer.id).second) {
            throw ValidationError("Duplicate layer id " + std::to_string(layer.id));
        }
        if (!layer.optional && layer.traits.empty()) {
            throw ValidationError("Required layer '" + layer.name + "' has no traits");
        }
        for (const auto& trait : layer.traits) {
            if (!trait_ids.insert(trait.id).second) {
                throw ValidationError("Duplicate trait id " + std::to_string(trait.id) +
                                      " in layer '" + layer.name + "'");
            }
            if (!std::isfinite(trait.rarity_weight) || trait.rarity_weight <= 0.0) {
                throw ValidationError("Trait '" + trait.name + "' has non-positive rarity weight");
            }
        }
    }

    for (const auto& layer : req.layers) {
        for (const auto& trait : layer.traits) {
            if (!trait.is_ruler()) continue;
            for (const auto& rule : trait.rules) {
                if (!layer_ids.count(rule.target_layer)) {
                    TRAITFORGE_WARN("Ignoring rule on trait '%s' targeting unknown layer %u",
                                    trait.name.c_str(), rule.target_layer);
                }
            }
        }
    }

    for (const auto& group : req.groups) {
        if (group.layers.empty()) {
            TRAITFORGE_WARN("Uniqueness group %u has no layers", group.id);
            continue;
        }
        if (!group_positions(group)) {
            TRAITFORGE_WARN("Uniqueness group %u names a layer missing from the catalog and is never enforced",
                            group.id);
        }
    }
}

std::optional<std::size_t> Catalog::layer_position(LayerId id) const {
    auto it = layer_index_.find(id);
    if (it == layer_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<TraitPosition> Catalog::trait_position(TraitId id) const {
    auto it = trait_index_.find(id);
    if (it == trait_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::vector<std::size_t>> Catalog::group_positions(const UniquenessGroup& group) const {
    std::vector<std::size_t> positions;
    positions.reserve(group.layers.size());
    for (LayerId id : group.layers) {
        auto pos = layer_position(id);
        if (!pos) return std::nullopt;
        if (std::find(positions.begin(), positions.end(), *pos) == positions.end()) {
            positions.push_back(*pos);
        }
    }
    return positions;
}

std::vector<TraitId> Catalog::selected_ids(const Assignment& assignment,
                                           const std::vector<std::size_t>& positions) const {
    std::vector<TraitId> ids;
    ids.reserve(positions.size());
    for (std::size_t pos : positions) {
        if (assignment.is_assigned(pos)) {
            ids.push_back(trait(pos, static_cast<std::size_t>(assignment.choice[pos])).id);
        }
    }
    return ids;
}

} // namespace traitforge
