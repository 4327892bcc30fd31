#include <traitforge/stb_codec.hpp>
#include <traitforge/errors.hpp>
#include <algorithm>
#include <climits>
#include <cstring>
#include <memory>
#include <string>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_WRITE_NO_STDIO
#include <stb_image_write.h>

namespace traitforge {

namespace {

void append_bytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(context);
    auto* bytes = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

bool is_allocation_failure(const char* reason) {
    return reason && std::strcmp(reason, "outofmem") == 0;
}

} // namespace

Surface StbImageCodec::decode(const std::vector<std::uint8_t>& payload,
                              std::uint32_t width, std::uint32_t height) {
    if (payload.empty()) {
        throw CodecError("Empty image payload", false);
    }
    if (payload.size() > static_cast<std::size_t>(INT_MAX)) {
        throw CodecError("Image payload too large", false);
    }

    int w = 0;
    int h = 0;
    int channels = 0;
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> data(
        stbi_load_from_memory(payload.data(), static_cast<int>(payload.size()), &w, &h, &channels, 4),
        &stbi_image_free);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw CodecError(std::string("Decode failed: ") + (reason ? reason : "unknown error"),
                         is_allocation_failure(reason));
    }

    // stb only decodes at the stored size; sample straight into the target
    const auto src_w = static_cast<std::uint32_t>(w);
    const auto src_h = static_cast<std::uint32_t>(h);
    Surface out(width, height);
    const stbi_uc* src = data.get();
    if (src_w == width && src_h == height) {
        std::copy_n(src, out.byte_size(), out.pixels().data());
        return out;
    }
    for (std::uint32_t y = 0; y < height; ++y) {
        std::uint32_t sy = static_cast<std::uint32_t>(static_cast<std::uint64_t>(y) * src_h / height);
        for (std::uint32_t x = 0; x < width; ++x) {
            std::uint32_t sx = static_cast<std::uint32_t>(static_cast<std::uint64_t>(x) * src_w / width);
            std::copy_n(src + (static_cast<std::size_t>(sy) * src_w + sx) * Surface::CHANNELS,
                        Surface::CHANNELS, out.pixel(x, y));
        }
    }
    return out;
}

std::vector<std::uint8_t> StbImageCodec::encode(const Surface& surface, ImageFormat format, int quality) {
    if (surface.empty()) {
        throw CodecError("Cannot encode an empty surface", false);
    }

    std::vector<std::uint8_t> out;
    const int w = static_cast<int>(surface.width());
    const int h = static_cast<int>(surface.height());
    const int comp = static_cast<int>(Surface::CHANNELS);
    int ok = 0;

    switch (format) {
        case ImageFormat::Jpeg:
            ok = stbi_write_jpg_to_func(append_bytes, &out, w, h, comp, surface.pixels().data(),
                                        std::clamp(quality, 1, 100));
            break;
        case ImageFormat::Png:
        case ImageFormat::Unknown:
            ok = stbi_write_png_to_func(append_bytes, &out, w, h, comp, surface.pixels().data(),
                                        w * comp);
            break;
    }

    if (!ok) {
        throw CodecError(std::string("Encode failed for ") + format_extension(format) + " output", false);
    }
    return out;
}

} // namespace traitforge
