#ifndef TRAITFORGE_STB_CODEC_HPP
#define TRAITFORGE_STB_CODEC_HPP

#include <traitforge/image_codec.hpp>

namespace traitforge {

/**
 * ImageCodec on top of stb_image / stb_image_write.
 * Decodes anything stb_image reads (PNG and JPEG among them) and encodes PNG
 * or baseline JPEG. Allocation failures are reported as transient.
 */
class StbImageCodec : public ImageCodec {
public:
    Surface decode(const std::vector<std::uint8_t>& payload,
                   std::uint32_t width, std::uint32_t height) override;

    std::vector<std::uint8_t> encode(const Surface& surface, ImageFormat format, int quality) override;
};

} // namespace traitforge

#endif // TRAITFORGE_STB_CODEC_HPP
