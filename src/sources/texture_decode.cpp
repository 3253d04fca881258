#include "texture_decode.hpp"
#include "../decode_helpers.hpp"

#include <ps2tex/image_assembler.hpp>
#include <ps2tex/palette.hpp>
#include <ps2tex/pixel_decoder.hpp>

#include <algorithm>
#include <vector>

namespace ps2tex {

decode_result decode_texture(std::span<const std::uint8_t> data,
                             const texture_record& record,
                             bool unswizzle_palette,
                             surface& surf,
                             const decode_options& options) {
    auto result = validate_dimensions(record.width, record.height, options);
    if (!result) return with_context(std::move(result), record.name, record.data_offset);

    const std::size_t end = std::min(record.end_offset, data.size());

    if (record.palette_offset > end || end - record.palette_offset < PS2_PALETTE_BYTES) {
        return with_context(decode_result::failure(decode_error::truncated_palette,
            "Palette needs " + std::to_string(PS2_PALETTE_BYTES) + " bytes"),
            record.name, record.palette_offset);
    }

    std::vector<std::uint8_t> raw(data.begin() + static_cast<std::ptrdiff_t>(record.palette_offset),
                                  data.begin() + static_cast<std::ptrdiff_t>(record.palette_offset + PS2_PALETTE_BYTES));
    if (unswizzle_palette) {
        ps2_unswizzle_palette(raw);
    }

    palette pal;
    result = extract_palette(raw, pal);
    if (!result) return with_context(std::move(result), record.name, record.palette_offset);

    const auto pixels = record.pixel_offset <= end
        ? data.subspan(record.pixel_offset, end - record.pixel_offset)
        : std::span<const std::uint8_t>{};

    index_grid grid;
    result = decode_indices(pixels, static_cast<int>(record.width), static_cast<int>(record.height), grid);
    if (!result) return with_context(std::move(result), record.name, record.pixel_offset);

    result = assemble(grid, pal, surf, options);
    if (!result) return with_context(std::move(result), record.name, record.pixel_offset);

    return decode_result::success();
}

std::string file_safe(std::string name) {
    std::replace(name.begin(), name.end(), '/', '_');
    std::replace(name.begin(), name.end(), '\\', '_');
    if (name == "." || name == "..") {
        name.assign(name.size(), '_');
    }
    return name;
}

} // namespace ps2tex
