#ifndef TRAITFORGE_COMPOSITOR_HPP
#define TRAITFORGE_COMPOSITOR_HPP

#include <traitforge/cache.hpp>
#include <traitforge/catalog.hpp>
#include <traitforge/image_codec.hpp>
#include <traitforge/surface.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace traitforge {

// Decoded trait surfaces kept for one run, evicted least-recently-used by bytes
using DecodeCache = Cache<TraitId, std::shared_ptr<const Surface>>;

std::unique_ptr<DecodeCache> make_decode_cache(std::size_t max_bytes);

// Called at every suspension point (before each decode and before encoding)
using YieldHook = std::function<void()>;

struct Composition {
    std::vector<std::uint8_t> image;
    ImageFormat format = ImageFormat::Png;
    std::vector<std::pair<std::string, std::string>> attributes;   // (layer name, trait name)
};

/**
 * Renders assignments onto one reused canvas.
 *
 * Layers are drawn in stacking order. Each trait is decoded directly at the
 * output size and dropped right after compositing unless the decode cache
 * keeps it. The output is PNG when any source was lossless, JPEG otherwise.
 */
class Compositor {
public:
    static constexpr int DEFAULT_JPEG_QUALITY = 90;
    static constexpr std::uint32_t PREVIEW_SIZE = 100;

    Compositor(const Catalog& catalog, ImageCodec& codec,
               DecodeCache* decode_cache = nullptr,
               int jpeg_quality = DEFAULT_JPEG_QUALITY);

    /**
     * @throws TraitCodecError when a trait fails to decode
     * @throws CodecError when encoding fails
     */
    Composition render(const Assignment& assignment, const YieldHook& yield = nullptr);

    // PNG thumbnail of the most recently rendered canvas
    std::vector<std::uint8_t> preview(std::uint32_t size = PREVIEW_SIZE);

    const Surface& canvas() const { return canvas_; }

private:
    std::shared_ptr<const Surface> decode_trait(const Trait& trait);

    const Catalog& catalog_;
    ImageCodec& codec_;
    DecodeCache* decode_cache_;
    int jpeg_quality_;
    Surface canvas_;
};

} // namespace traitforge

#endif // TRAITFORGE_COMPOSITOR_HPP
