#pragma once
#include <gtest/gtest.h>
#include <traitforge/errors.hpp>
#include <traitforge/image_codec.hpp>
#include <traitforge/messages.hpp>
#include <traitforge/surface.hpp>
#include <traitforge/types.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace test_utils {

/**
 * Fake trait payloads: a real PNG or JPEG signature followed by one RGBA
 * pixel that FakeCodec paints across the whole surface.
 */
inline std::vector<std::uint8_t> png_payload(std::uint8_t r, std::uint8_t g, std::uint8_t b,
                                             std::uint8_t a = 255) {
    return {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, r, g, b, a};
}

inline std::vector<std::uint8_t> jpeg_payload(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    return {0xFF, 0xD8, 0xFF, 0xE0, r, g, b, 255};
}

// Payloads FakeCodec refuses to decode
inline std::vector<std::uint8_t> corrupt_payload() {
    return {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 'B', 'A', 'D', '!'};
}

inline std::vector<std::uint8_t> out_of_memory_payload() {
    return {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 'O', 'O', 'M', '!'};
}

/**
 * In-memory codec. Decode fills the surface with the payload's trailing
 * RGBA pixel; encode emits the format signature, the dimensions and the
 * first canvas pixel so tests can check what was composited.
 */
class FakeCodec : public traitforge::ImageCodec {
public:
    traitforge::Surface decode(const std::vector<std::uint8_t>& payload,
                               std::uint32_t width, std::uint32_t height) override {
        ++decode_calls;
        if (payload.size() < 4) {
            throw traitforge::CodecError("payload too short", false);
        }
        std::string tail(payload.end() - 4, payload.end());
        if (tail == "BAD!") throw traitforge::CodecError("corrupt payload", false);
        if (tail == "OOM!") throw traitforge::CodecError("allocation failed", true);

        traitforge::Surface surface(width, height);
        for (std::uint32_t y = 0; y < height; ++y) {
            for (std::uint32_t x = 0; x < width; ++x) {
                std::copy(payload.end() - 4, payload.end(), surface.pixel(x, y));
            }
        }
        return surface;
    }

    std::vector<std::uint8_t> encode(const traitforge::Surface& surface, traitforge::ImageFormat format,
                                     int quality) override {
        ++encode_calls;
        last_quality = quality;
        std::vector<std::uint8_t> out;
        if (format == traitforge::ImageFormat::Jpeg) {
            out = {0xFF, 0xD8, 0xFF};
        } else {
            out = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
        }
        out.push_back(static_cast<std::uint8_t>(surface.width()));
        out.push_back(static_cast<std::uint8_t>(surface.height()));
        if (!surface.empty()) {
            out.insert(out.end(), surface.pixel(0, 0), surface.pixel(0, 0) + 4);
        }
        return out;
    }

    std::atomic<int> decode_calls{0};
    std::atomic<int> encode_calls{0};
    std::atomic<int> last_quality{0};
};

inline traitforge::Trait make_trait(traitforge::TraitId id, const std::string& name, double weight = 1.0) {
    traitforge::Trait trait;
    trait.id = id;
    trait.name = name;
    trait.rarity_weight = weight;
    trait.payload = png_payload(static_cast<std::uint8_t>(id * 10), 0, 0);
    return trait;
}

inline traitforge::Trait make_ruler(traitforge::TraitId id, const std::string& name,
                                    traitforge::LayerId target,
                                    std::vector<traitforge::TraitId> forbidden,
                                    std::vector<traitforge::TraitId> allowed = {}) {
    traitforge::Trait trait = make_trait(id, name);
    trait.role = traitforge::TraitRole::Ruler;
    trait.rules.push_back({target, std::move(forbidden), std::move(allowed)});
    return trait;
}

inline traitforge::Layer make_layer(traitforge::LayerId id, const std::string& name, int order,
                                    std::vector<traitforge::Trait> traits, bool optional = false) {
    traitforge::Layer layer;
    layer.id = id;
    layer.name = name;
    layer.order = order;
    layer.optional = optional;
    layer.traits = std::move(traits);
    return layer;
}

inline traitforge::GenerationRequest base_request(std::size_t count) {
    traitforge::GenerationRequest request;
    request.count = count;
    request.output = {8, 8};
    request.naming.collection_name = "Test";
    request.naming.description = "Test collection";
    request.seed = 42;
    return request;
}

/**
 * Background {Red, Blue} x Shape {Circle, Square}, with one group over both
 * layers: exactly four unique combinations.
 */
inline traitforge::GenerationRequest two_by_two_request(std::size_t count) {
    auto request = base_request(count);
    request.layers.push_back(make_layer(1, "Background", 0, {make_trait(1, "Red"), make_trait(2, "Blue")}));
    request.layers.push_back(make_layer(2, "Shape", 1, {make_trait(3, "Circle"), make_trait(4, "Square")}));
    request.groups.push_back({1, {1, 2}, true});
    return request;
}

/**
 * Same catalog, but Red forbids Square: three valid combinations.
 */
inline traitforge::GenerationRequest red_forbids_square_request(std::size_t count) {
    auto request = base_request(count);
    request.layers.push_back(make_layer(1, "Background", 0,
                                        {make_ruler(1, "Red", 2, {4}), make_trait(2, "Blue")}));
    request.layers.push_back(make_layer(2, "Shape", 1, {make_trait(3, "Circle"), make_trait(4, "Square")}));
    request.groups.push_back({1, {1, 2}, true});
    return request;
}

/**
 * A catalog large enough that uniqueness never binds in tests:
 * 4 layers x 6 traits, no groups.
 */
inline traitforge::GenerationRequest wide_request(std::size_t count) {
    auto request = base_request(count);
    traitforge::TraitId next = 1;
    for (traitforge::LayerId l = 1; l <= 4; ++l) {
        std::vector<traitforge::Trait> traits;
        for (int t = 0; t < 6; ++t, ++next) {
            traits.push_back(make_trait(next, "T" + std::to_string(next)));
        }
        request.layers.push_back(make_layer(l, "L" + std::to_string(l), static_cast<int>(l), std::move(traits)));
    }
    return request;
}

/**
 * Three layers of two colours each where every pair of layers must differ.
 * Each trait has a compatible partner in every other layer, so arc
 * consistency holds, but three layers can't all differ with two colours.
 */
inline traitforge::GenerationRequest all_different_request(std::size_t count) {
    auto request = base_request(count);
    auto ruler = [](traitforge::TraitId id, const std::string& name,
                    std::vector<std::pair<traitforge::LayerId, traitforge::TraitId>> forbids) {
        traitforge::Trait trait = make_trait(id, name);
        if (forbids.empty()) return trait;
        trait.role = traitforge::TraitRole::Ruler;
        for (const auto& [layer, other] : forbids) {
            trait.rules.push_back({layer, {other}, {}});
        }
        return trait;
    };
    request.layers.push_back(make_layer(1, "A", 0, {ruler(1, "A red", {{2, 3}, {3, 5}}),
                                                    ruler(2, "A blue", {{2, 4}, {3, 6}})}));
    request.layers.push_back(make_layer(2, "B", 1, {ruler(3, "B red", {{3, 5}}),
                                                    ruler(4, "B blue", {{3, 6}})}));
    request.layers.push_back(make_layer(3, "C", 2, {ruler(5, "C red", {}), ruler(6, "C blue", {})}));
    return request;
}

/**
 * Thread-safe sink that records every outbound message.
 */
class MessageLog {
public:
    void push(traitforge::WorkerOutbound message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (traitforge::is_terminal(message)) ++terminal_count_;
            messages_.push_back(std::move(message));
        }
        cv_.notify_all();
    }

    std::function<void(traitforge::WorkerOutbound)> sink() {
        return [this](traitforge::WorkerOutbound message) { push(std::move(message)); };
    }

    bool wait_for_terminal(std::size_t count = 1,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return terminal_count_ >= count; });
    }

    template<typename Predicate>
    bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return predicate(messages_); });
    }

    std::vector<traitforge::WorkerOutbound> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    template<typename T>
    std::vector<T> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        for (const auto& m : messages_) {
            if (auto* typed = std::get_if<T>(&m)) out.push_back(*typed);
        }
        return out;
    }

    std::vector<traitforge::Artifact> artifacts() const {
        std::vector<traitforge::Artifact> out;
        for (const auto& batch : all<traitforge::ArtifactBatchMessage>()) {
            out.insert(out.end(), batch.artifacts.begin(), batch.artifacts.end());
        }
        return out;
    }

    std::size_t terminal_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminal_count_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<traitforge::WorkerOutbound> messages_;
    std::size_t terminal_count_ = 0;
};

} // namespace test_utils
