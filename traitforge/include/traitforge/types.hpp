#ifndef TRAITFORGE_TYPES_HPP
#define TRAITFORGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace traitforge {

using LayerId = std::uint32_t;
using TraitId = std::uint32_t;
using GroupId = std::uint32_t;
using TaskId = std::uint64_t;

constexpr TaskId INVALID_TASK = std::numeric_limits<TaskId>::max();

enum class TraitRole {
    Normal,
    Ruler      // Carries compatibility rules against other layers
};

/**
 * Restriction a ruler trait places on one other layer.
 * An empty allowed list means every trait not explicitly forbidden is fine.
 */
struct CompatibilityRule {
    LayerId target_layer = 0;
    std::vector<TraitId> forbidden;
    std::vector<TraitId> allowed;

    // Forbidden always wins over the allowed whitelist
    bool permits(TraitId trait) const;
};

struct Trait {
    TraitId id = 0;
    std::string name;
    double rarity_weight = 1.0;   // Higher is more common
    TraitRole role = TraitRole::Normal;
    std::vector<CompatibilityRule> rules;
    std::vector<std::uint8_t> payload;   // Encoded PNG or JPEG bytes

    bool is_ruler() const { return role == TraitRole::Ruler; }
    const CompatibilityRule* rule_for(LayerId layer) const;
};

struct Layer {
    LayerId id = 0;
    std::string name;
    int order = 0;          // Stacking order, lower is drawn first
    bool optional = false;
    std::vector<Trait> traits;
};

/**
 * Set of layers whose joint selection may not repeat within one run.
 */
struct UniquenessGroup {
    GroupId id = 0;
    std::vector<LayerId> layers;
    bool active = true;
};

struct OutputSize {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
};

struct NamingOptions {
    std::string collection_name;
    std::string description;
    std::string symbol;                        // Solana only
    std::uint32_t seller_fee_basis_points = 0; // Solana only
};

enum class MetadataFormat {
    Erc721,
    Solana
};

struct GenerationRequest {
    std::vector<Layer> layers;
    std::size_t count = 0;
    OutputSize output;
    NamingOptions naming;
    std::vector<UniquenessGroup> groups;
    MetadataFormat metadata_format = MetadataFormat::Erc721;
    std::optional<std::uint64_t> seed;
};

/**
 * Per-layer decision, indexed by catalog position (not by LayerId).
 * Non-negative values are positions into the layer's trait list.
 */
struct Assignment {
    static constexpr std::int32_t UNASSIGNED = -1;
    static constexpr std::int32_t SKIPPED = -2;

    std::vector<std::int32_t> choice;

    Assignment() = default;
    explicit Assignment(std::size_t layer_count) : choice(layer_count, UNASSIGNED) {}

    std::size_t size() const { return choice.size(); }
    bool is_assigned(std::size_t layer) const { return choice[layer] >= 0; }
    bool is_skipped(std::size_t layer) const { return choice[layer] == SKIPPED; }
    bool is_decided(std::size_t layer) const { return choice[layer] != UNASSIGNED; }

    bool operator==(const Assignment& other) const { return choice == other.choice; }
};

enum class ImageFormat {
    Png,
    Jpeg,
    Unknown
};

/**
 * One generated item. Buffers move to the caller on emission.
 */
struct Artifact {
    std::size_t index = 0;                        // 1-based sequence index
    std::string image_name;                       // "<index>.png" or "<index>.jpg"
    ImageFormat format = ImageFormat::Png;
    std::vector<std::uint8_t> image;
    std::vector<std::pair<std::string, std::string>> attributes;  // (layer name, trait name)
    std::string metadata_name;                    // "<index>.json"
    std::string metadata;                         // Formatted JSON record
    Assignment assignment;                        // Selection behind the image
};

} // namespace traitforge

#endif // TRAITFORGE_TYPES_HPP
