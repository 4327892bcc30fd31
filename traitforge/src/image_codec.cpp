#include <traitforge/image_codec.hpp>

namespace traitforge {

ImageFormat sniff_format(const std::vector<std::uint8_t>& payload) {
    static const std::uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    if (payload.size() >= 8) {
        bool png = true;
        for (std::size_t i = 0; i < 8; ++i) {
            if (payload[i] != PNG_SIGNATURE[i]) {
                png = false;
                break;
            }
        }
        if (png) return ImageFormat::Png;
    }
    // SOI marker followed by the start of another marker
    if (payload.size() >= 3 && payload[0] == 0xFF && payload[1] == 0xD8 && payload[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    return ImageFormat::Unknown;
}

const char* format_extension(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "png";
        case ImageFormat::Jpeg: return "jpg";
        case ImageFormat::Unknown: break;
    }
    return "bin";
}

} // namespace traitforge
