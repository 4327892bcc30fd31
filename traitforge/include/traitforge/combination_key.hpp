#ifndef TRAITFORGE_COMBINATION_KEY_HPP
#define TRAITFORGE_COMBINATION_KEY_HPP

#include <traitforge/types.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace traitforge {

namespace indexer {

constexpr std::size_t BITS_PER_ID = 8;
constexpr std::size_t MAX_IDS = 8;
constexpr TraitId MAX_ID = (1u << BITS_PER_ID) - 1;

/**
 * Pack up to MAX_IDS ids (each <= MAX_ID) into one 64-bit key, slot 0 in the
 * lowest byte. Order is preserved, so callers sort first when the tuple is
 * meant to be order-independent.
 * @throws std::out_of_range if an id or the tuple length is out of bounds
 */
std::uint64_t pack(const std::vector<TraitId>& ids);

// Same as pack() but reports out-of-bounds input as nullopt
std::optional<std::uint64_t> try_pack(const std::vector<TraitId>& ids);

/**
 * Inverse of pack(). The length must be supplied because id 0 is a valid id.
 */
std::vector<TraitId> unpack(std::uint64_t key, std::size_t length);

bool fits(const std::vector<TraitId>& ids);

/**
 * FNV-1a over the decimal ids joined with '|'. Used when a tuple does not fit
 * the packed form.
 */
std::uint32_t hash_ids(const std::vector<TraitId>& ids);

} // namespace indexer

/**
 * Order-independent identity of a trait tuple.
 *
 * Exact keys are collision-free. Approximate keys are 32-bit hashes and two
 * distinct tuples can share one; a collision makes the tracker treat a fresh
 * combination as already used, so the failure mode is a spurious rejection,
 * never a duplicate. Both kinds share one key space: the kind and tuple length
 * are part of equality, so an exact key never equals an approximate one.
 */
class CombinationKey {
public:
    enum class Kind : std::uint8_t {
        Exact,
        Approximate
    };

    CombinationKey() = default;

    // Sorts the ids and packs them. Throws std::out_of_range when they don't fit.
    static CombinationKey exact(std::vector<TraitId> ids);

    // Sorts the ids and hashes them
    static CombinationKey approximate(std::vector<TraitId> ids);

    // Exact when the sorted tuple fits, approximate otherwise
    static CombinationKey from_ids(std::vector<TraitId> ids);

    Kind kind() const { return kind_; }
    bool is_exact() const { return kind_ == Kind::Exact; }
    std::size_t length() const { return length_; }
    std::uint64_t value() const { return value_; }

    // Sorted ids; only meaningful for exact keys
    std::vector<TraitId> ids() const;

    bool operator==(const CombinationKey& other) const {
        return kind_ == other.kind_ && length_ == other.length_ && value_ == other.value_;
    }
    bool operator!=(const CombinationKey& other) const { return !(*this == other); }

private:
    CombinationKey(Kind kind, std::uint8_t length, std::uint64_t value)
        : kind_(kind), length_(length), value_(value) {}

    Kind kind_ = Kind::Exact;
    std::uint8_t length_ = 0;
    std::uint64_t value_ = 0;
};

} // namespace traitforge

namespace std {
    template<>
    struct hash<traitforge::CombinationKey> {
        std::size_t operator()(const traitforge::CombinationKey& key) const {
            std::size_t h = std::hash<std::uint64_t>{}(key.value());
            h ^= (static_cast<std::size_t>(key.length()) << 1) ^
                 (key.is_exact() ? 0x9e3779b97f4a7c15ULL : 0);
            return h;
        }
    };
}

#endif // TRAITFORGE_COMBINATION_KEY_HPP
