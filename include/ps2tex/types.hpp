#ifndef PS2TEX_TYPES_HPP_
#define PS2TEX_TYPES_HPP_

#include <ps2tex/ps2tex_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ps2tex {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    indexed8,   // 8-bit indices, up to 256 colors
    rgb888      // 24-bit, 8-bit RGB components, no alpha
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::indexed8: return 1;
        case pixel_format::rgb888:   return 3;
    }
    return 0;
}

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    pattern_not_found,
    truncated_header,
    truncated_palette,
    truncated_pixel_data,
    out_of_range,
    palette_index_out_of_range,
    dimensions_exceeded,
    invalid_format,
    io_error,
    internal_error
};

[[nodiscard]] PS2TEX_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

// How an index that has no palette entry is handled during assembly.
enum class palette_index_policy {
    strict,  // fail with palette_index_out_of_range
    wrap     // use index % palette size
};

struct decode_options {
    // Maximum allowed texture dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;

    // Largest input file session::load accepts
    std::size_t max_file_size = 256u * 1024u * 1024u;

    palette_index_policy index_policy = palette_index_policy::strict;

    // Undo the GS CLUT bank interleave on fixed-header palettes
    bool ps2_palette_swizzle = true;

    // Marker-scan pipeline patterns
    std::string name_marker = "psx_";
    std::vector<std::uint8_t> data_sentinel = {0xFF, 0xFF, 0xFF, 0x80};
};

} // namespace ps2tex

#endif // PS2TEX_TYPES_HPP_
