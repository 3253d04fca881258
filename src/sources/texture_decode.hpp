#pragma once

#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>
#include <ps2tex/texture_record.hpp>

#include <cstdint>
#include <span>
#include <string>

namespace ps2tex {

// Palette + index decode shared by both sources. Palette and pixels must lie
// within [record.palette_offset, record.end_offset).
[[nodiscard]] decode_result decode_texture(std::span<const std::uint8_t> data,
                                           const texture_record& record,
                                           bool unswizzle_palette,
                                           surface& surf,
                                           const decode_options& options);

// Replace characters that would leave the output directory
[[nodiscard]] std::string file_safe(std::string name);

} // namespace ps2tex
