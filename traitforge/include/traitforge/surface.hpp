#ifndef TRAITFORGE_SURFACE_HPP
#define TRAITFORGE_SURFACE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace traitforge {

/**
 * RGBA8 pixel buffer, straight (non-premultiplied) alpha, rows top to bottom.
 */
class Surface {
public:
    static constexpr std::size_t CHANNELS = 4;

    Surface() = default;
    Surface(std::uint32_t width, std::uint32_t height);
    Surface(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> pixels);

    std::uint32_t width() const { return width_; }
    std::uint32_t height() const { return height_; }
    bool empty() const { return pixels_.empty(); }
    std::size_t byte_size() const { return pixels_.size(); }

    const std::vector<std::uint8_t>& pixels() const { return pixels_; }
    std::vector<std::uint8_t>& pixels() { return pixels_; }

    const std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) const {
        return &pixels_[(static_cast<std::size_t>(y) * width_ + x) * CHANNELS];
    }
    std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) {
        return &pixels_[(static_cast<std::size_t>(y) * width_ + x) * CHANNELS];
    }

    // Fully transparent
    void clear();

    // Reallocate only when the dimensions change; contents are cleared
    void reset(std::uint32_t width, std::uint32_t height);

    // Nearest-neighbour resample
    Surface resized(std::uint32_t width, std::uint32_t height) const;

    /**
     * Source-over composite of an equally sized surface onto this one.
     * @throws std::invalid_argument on a size mismatch
     */
    void composite(const Surface& source);

    bool is_opaque() const;

private:
    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

} // namespace traitforge

#endif // TRAITFORGE_SURFACE_HPP
