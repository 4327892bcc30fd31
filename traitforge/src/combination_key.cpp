#include <traitforge/combination_key.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace traitforge {
namespace indexer {

bool fits(const std::vector<TraitId>& ids) {
    if (ids.size() > MAX_IDS) return false;
    return std::all_of(ids.begin(), ids.end(), [](TraitId id) { return id <= MAX_ID; });
}

std::optional<std::uint64_t> try_pack(const std::vector<TraitId>& ids) {
    if (!fits(ids)) return std::nullopt;

    std::uint64_t key = 0;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        key |= static_cast<std::uint64_t>(ids[i]) << (i * BITS_PER_ID);
    }
    return key;
}

std::uint64_t pack(const std::vector<TraitId>& ids) {
    if (ids.size() > MAX_IDS) {
        throw std::out_of_range("Cannot pack " + std::to_string(ids.size()) +
                                " ids, at most " + std::to_string(MAX_IDS) + " fit");
    }
    for (TraitId id : ids) {
        if (id > MAX_ID) {
            throw std::out_of_range("Id " + std::to_string(id) + " exceeds packable maximum " +
                                    std::to_string(MAX_ID));
        }
    }
    return *try_pack(ids);
}

std::vector<TraitId> unpack(std::uint64_t key, std::size_t length) {
    if (length > MAX_IDS) {
        throw std::out_of_range("Packed keys hold at most " + std::to_string(MAX_IDS) + " ids");
    }
    std::vector<TraitId> ids;
    ids.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        ids.push_back(static_cast<TraitId>((key >> (i * BITS_PER_ID)) & MAX_ID));
    }
    return ids;
}

std::uint32_t hash_ids(const std::vector<TraitId>& ids) {
    // FNV-1a, 32-bit
    std::uint32_t hash = 2166136261u;
    constexpr std::uint32_t FNV_PRIME = 16777619u;

    auto mix = [&](char c) {
        hash ^= static_cast<std::uint8_t>(c);
        hash *= FNV_PRIME;
    };

    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) mix('|');
        for (char c : std::to_string(ids[i])) mix(c);
    }
    return hash;
}

} // namespace indexer

CombinationKey CombinationKey::exact(std::vector<TraitId> ids) {
    std::sort(ids.begin(), ids.end());
    std::uint64_t value = indexer::pack(ids);
    return CombinationKey(Kind::Exact, static_cast<std::uint8_t>(ids.size()), value);
}

CombinationKey CombinationKey::approximate(std::vector<TraitId> ids) {
    std::sort(ids.begin(), ids.end());
    // Length is clamped into the tag byte; it only narrows the key space further
    auto length = static_cast<std::uint8_t>(std::min<std::size_t>(ids.size(), 255));
    return CombinationKey(Kind::Approximate, length, indexer::hash_ids(ids));
}

CombinationKey CombinationKey::from_ids(std::vector<TraitId> ids) {
    std::sort(ids.begin(), ids.end());
    if (auto packed = indexer::try_pack(ids)) {
        return CombinationKey(Kind::Exact, static_cast<std::uint8_t>(ids.size()), *packed);
    }
    return approximate(std::move(ids));
}

std::vector<TraitId> CombinationKey::ids() const {
    if (kind_ != Kind::Exact) {
        throw std::logic_error("Approximate combination keys cannot be unpacked");
    }
    return indexer::unpack(value_, length_);
}

} // namespace traitforge
