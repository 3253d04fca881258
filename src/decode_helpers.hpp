#pragma once

#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace ps2tex {

// Default dimension limit
constexpr int DEFAULT_MAX_DIMENSION = 16384;

// Get effective dimension limits from options
inline std::pair<int, int> get_dimension_limits(const decode_options& options,
                                                 int default_limit = DEFAULT_MAX_DIMENSION) {
    int max_w = options.max_width > 0 ? options.max_width : default_limit;
    int max_h = options.max_height > 0 ? options.max_height : default_limit;
    return {max_w, max_h};
}

// Validate dimensions against limits, returning failure result if exceeded
inline decode_result validate_dimensions(std::uint32_t width, std::uint32_t height,
                                          const decode_options& options) {
    if (width == 0 || height == 0) {
        return decode_result::failure(decode_error::out_of_range,
            "Texture has zero width or height");
    }
    auto [max_w, max_h] = get_dimension_limits(options);
    if (width > static_cast<std::uint32_t>(max_w) || height > static_cast<std::uint32_t>(max_h)) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Texture dimensions " + std::to_string(width) + "x" + std::to_string(height) +
            " exceed limits");
    }
    return decode_result::success();
}

// Copy pixel data row-by-row to a surface
inline void write_rows(surface& surf, const std::uint8_t* data,
                       std::size_t row_bytes, int height) {
    for (int y = 0; y < height; ++y) {
        surf.write_pixels(0, y, static_cast<int>(row_bytes),
                          data + static_cast<std::size_t>(y) * row_bytes);
    }
}

// Row stride calculation (4-byte aligned, for BMP)
inline std::size_t row_stride_4byte(int width, int bits_per_pixel) {
    return ((static_cast<std::size_t>(width) * static_cast<std::size_t>(bits_per_pixel) + 31) / 32) * 4;
}

// "0x1a2b" formatting for diagnostics
inline std::string hex_offset(std::size_t offset) {
    char buf[2 + sizeof(std::size_t) * 2 + 1];
    std::snprintf(buf, sizeof(buf), "0x%zx", offset);
    return buf;
}

// Prefix a failure message with the record it belongs to
inline decode_result with_context(decode_result result, const std::string& name, std::size_t offset) {
    if (!result.ok) {
        result.message = "'" + name + "' at " + hex_offset(offset) + ": " + result.message;
    }
    return result;
}

} // namespace ps2tex
