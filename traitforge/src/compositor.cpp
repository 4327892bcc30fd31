#include <traitforge/compositor.hpp>
#include <traitforge/debug_log.hpp>
#include <traitforge/errors.hpp>

namespace traitforge {

std::unique_ptr<DecodeCache> make_decode_cache(std::size_t max_bytes) {
    return std::make_unique<DecodeCache>(
        CacheLimits{0, max_bytes},
        std::make_unique<LruPolicy<TraitId>>(),
        [](const std::shared_ptr<const Surface>& surface) {
            return surface ? surface->byte_size() : std::size_t(0);
        });
}

Compositor::Compositor(const Catalog& catalog, ImageCodec& codec,
                       DecodeCache* decode_cache, int jpeg_quality)
    : catalog_(catalog), codec_(codec), decode_cache_(decode_cache), jpeg_quality_(jpeg_quality) {}

std::shared_ptr<const Surface> Compositor::decode_trait(const Trait& trait) {
    if (decode_cache_) {
        if (auto hit = decode_cache_->get(trait.id)) {
            return *hit;
        }
    }

    const OutputSize& size = catalog_.request().output;
    std::shared_ptr<const Surface> surface;
    try {
        surface = std::make_shared<const Surface>(codec_.decode(trait.payload, size.width, size.height));
    } catch (const CodecError& e) {
        throw TraitCodecError("Failed to decode trait '" + trait.name + "': " + e.what(),
                              e.transient(), trait.id);
    }

    if (surface->width() != size.width || surface->height() != size.height) {
        surface = std::make_shared<const Surface>(surface->resized(size.width, size.height));
    }

    if (decode_cache_) {
        decode_cache_->put(trait.id, surface);
    }
    return surface;
}

Composition Compositor::render(const Assignment& assignment, const YieldHook& yield) {
    const OutputSize& size = catalog_.request().output;
    canvas_.reset(size.width, size.height);

    Composition result;
    bool any_lossless = false;

    for (std::size_t layer : catalog_.stacking_order()) {
        if (!assignment.is_assigned(layer)) continue;
        const Trait& trait = catalog_.trait(layer, static_cast<std::size_t>(assignment.choice[layer]));

        if (yield) yield();

        ImageFormat source = sniff_format(trait.payload);
        if (source != ImageFormat::Jpeg) any_lossless = true;

        {
            auto decoded = decode_trait(trait);
            canvas_.composite(*decoded);
        }
        result.attributes.emplace_back(catalog_.layer(layer).name, trait.name);
    }

    // An empty selection (every layer skipped) still yields a transparent PNG
    result.format = (any_lossless || result.attributes.empty()) ? ImageFormat::Png : ImageFormat::Jpeg;

    if (yield) yield();
    result.image = codec_.encode(canvas_, result.format, jpeg_quality_);

    TRAITFORGE_DEBUG("Rendered %zu layers to %zu bytes", result.attributes.size(), result.image.size());
    return result;
}

std::vector<std::uint8_t> Compositor::preview(std::uint32_t size) {
    Surface thumbnail = canvas_.resized(size, size);
    return codec_.encode(thumbnail, ImageFormat::Png, jpeg_quality_);
}

} // namespace traitforge
