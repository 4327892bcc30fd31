#include <traitforge/surface.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace traitforge {

Surface::Surface(std::uint32_t width, std::uint32_t height)
    : width_(width), height_(height),
      pixels_(static_cast<std::size_t>(width) * height * CHANNELS, 0) {}

Surface::Surface(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
    if (pixels_.size() != static_cast<std::size_t>(width) * height * CHANNELS) {
        throw std::invalid_argument("Pixel buffer of " + std::to_string(pixels_.size()) +
                                    " bytes does not match " + std::to_string(width) + "x" +
                                    std::to_string(height));
    }
}

void Surface::clear() {
    std::fill(pixels_.begin(), pixels_.end(), 0);
}

void Surface::reset(std::uint32_t width, std::uint32_t height) {
    if (width != width_ || height != height_) {
        width_ = width;
        height_ = height;
        pixels_.assign(static_cast<std::size_t>(width) * height * CHANNELS, 0);
        return;
    }
    clear();
}

Surface Surface::resized(std::uint32_t width, std::uint32_t height) const {
    if (width == width_ && height == height_) {
        return *this;
    }
    Surface out(width, height);
    if (empty()) return out;

    for (std::uint32_t y = 0; y < height; ++y) {
        std::uint32_t sy = static_cast<std::uint32_t>(static_cast<std::uint64_t>(y) * height_ / height);
        for (std::uint32_t x = 0; x < width; ++x) {
            std::uint32_t sx = static_cast<std::uint32_t>(static_cast<std::uint64_t>(x) * width_ / width);
            std::copy_n(pixel(sx, sy), CHANNELS, out.pixel(x, y));
        }
    }
    return out;
}

void Surface::composite(const Surface& source) {
    if (source.width_ != width_ || source.height_ != height_) {
        throw std::invalid_argument("Cannot composite a surface of a different size");
    }

    const std::size_t count = static_cast<std::size_t>(width_) * height_;
    const std::uint8_t* src = source.pixels_.data();
    std::uint8_t* dst = pixels_.data();

    for (std::size_t i = 0; i < count; ++i, src += CHANNELS, dst += CHANNELS) {
        std::uint32_t sa = src[3];
        if (sa == 0) continue;
        if (sa == 255) {
            std::copy_n(src, CHANNELS, dst);
            continue;
        }

        // out_a = sa + da * (1 - sa), colours weighted by their alpha contribution
        std::uint32_t da = dst[3];
        std::uint32_t inv = 255 - sa;
        std::uint32_t out_a = sa + (da * inv + 127) / 255;
        if (out_a == 0) {
            std::fill_n(dst, CHANNELS, 0);
            continue;
        }
        for (std::size_t c = 0; c < 3; ++c) {
            std::uint32_t num = src[c] * sa * 255 + dst[c] * da * inv;
            dst[c] = static_cast<std::uint8_t>((num + out_a * 255 / 2) / (out_a * 255));
        }
        dst[3] = static_cast<std::uint8_t>(out_a);
    }
}

bool Surface::is_opaque() const {
    for (std::size_t i = 3; i < pixels_.size(); i += CHANNELS) {
        if (pixels_[i] != 255) return false;
    }
    return true;
}

} // namespace traitforge
