#ifndef PS2TEX_PIXEL_DECODER_HPP_
#define PS2TEX_PIXEL_DECODER_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace ps2tex {

// ============================================================================
// Index Grid
// ============================================================================

/**
 * Row-major grid of 8-bit palette indices.
 * Meaningless without the palette it was decoded alongside.
 */
class PS2TEX_EXPORT index_grid {
public:
    index_grid() = default;
    index_grid(int width, int height, std::vector<std::uint8_t> cells)
        : cells_(std::move(cells)), width_(width), height_(height) {}

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] bool empty() const noexcept { return cells_.empty(); }

    [[nodiscard]] std::uint8_t at(int x, int y) const noexcept {
        return cells_[static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                      static_cast<std::size_t>(x)];
    }

    [[nodiscard]] std::span<const std::uint8_t> row(int y) const noexcept {
        return std::span<const std::uint8_t>(cells_).subspan(
            static_cast<std::size_t>(y) * static_cast<std::size_t>(width_),
            static_cast<std::size_t>(width_));
    }

    [[nodiscard]] std::span<const std::uint8_t> cells() const noexcept { return cells_; }

private:
    std::vector<std::uint8_t> cells_;
    int width_ = 0;
    int height_ = 0;
};

/**
 * Read width * height index bytes, row 0 first, left to right.
 * Each byte is one palette index; there is no sub-byte packing.
 * @param bytes Pixel data starting at the first index
 * @param width Texture width
 * @param height Texture height
 * @param out Receives the grid; untouched on failure
 * @return truncated_pixel_data if fewer than width * height bytes are available
 */
[[nodiscard]] PS2TEX_EXPORT decode_result decode_indices(std::span<const std::uint8_t> bytes,
                                                         int width,
                                                         int height,
                                                         index_grid& out);

} // namespace ps2tex

#endif // PS2TEX_PIXEL_DECODER_HPP_
