#ifndef TRAITFORGE_IMAGE_CODEC_HPP
#define TRAITFORGE_IMAGE_CODEC_HPP

#include <traitforge/surface.hpp>
#include <traitforge/types.hpp>
#include <cstdint>
#include <vector>

namespace traitforge {

// Detect PNG or JPEG by signature bytes
ImageFormat sniff_format(const std::vector<std::uint8_t>& payload);

inline bool is_lossless(ImageFormat format) { return format == ImageFormat::Png; }

const char* format_extension(ImageFormat format);

/**
 * Decoder/encoder backend for the compositor.
 * Implementations throw CodecError on failure and must be usable from one
 * worker thread at a time.
 */
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    /**
     * Decode a trait payload straight to the output size.
     * @return surface of exactly width x height
     */
    virtual Surface decode(const std::vector<std::uint8_t>& payload,
                           std::uint32_t width, std::uint32_t height) = 0;

    /**
     * @param quality 1-100, ignored by lossless formats
     */
    virtual std::vector<std::uint8_t> encode(const Surface& surface, ImageFormat format, int quality) = 0;
};

} // namespace traitforge

#endif // TRAITFORGE_IMAGE_CODEC_HPP
