#ifndef PS2TEX_PALETTE_HPP_
#define PS2TEX_PALETTE_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ps2tex {

// ============================================================================
// PS2 CLUT Layout
// ============================================================================
//
// 8-bit textures carry a 256-entry color lookup table of 32-bit quads.
// The first three bytes of each quad are R, G, B; the fourth is alpha
// (0x80 = opaque on the GS) and is discarded.

constexpr std::size_t PS2_PALETTE_ENTRIES = 256;
constexpr std::size_t PS2_PALETTE_ENTRY_STRIDE = 4;
constexpr std::size_t PS2_PALETTE_BYTES = PS2_PALETTE_ENTRIES * PS2_PALETTE_ENTRY_STRIDE;

struct palette_entry {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    friend bool operator==(const palette_entry&, const palette_entry&) = default;
};

using palette = std::vector<palette_entry>;

/**
 * Reorder a GS CLUT into linear index order, in place.
 *
 * The GS stores 8-bit CLUTs in blocks of 32 entries whose second and third
 * groups of 8 entries are exchanged. Within every 0x20 * stride byte block,
 * each byte at block offset [0x10 * stride, 0x18 * stride) is swapped with the
 * byte 0x08 * stride before it. Applying the function twice restores the input.
 *
 * @param raw Palette bytes (normally PS2_PALETTE_BYTES)
 * @param entry_stride Bytes per palette entry
 */
PS2TEX_EXPORT void ps2_unswizzle_palette(std::span<std::uint8_t> raw,
                                         std::size_t entry_stride = PS2_PALETTE_ENTRY_STRIDE) noexcept;

/**
 * Read count entries of entry_stride bytes, keeping R, G, B of each.
 * @param bytes Raw palette bytes
 * @param out Receives count entries
 * @param entry_stride Bytes per entry (at least 3)
 * @param count Number of entries
 * @return truncated_palette if bytes is shorter than count * entry_stride
 */
[[nodiscard]] PS2TEX_EXPORT decode_result extract_palette(std::span<const std::uint8_t> bytes,
                                                          palette& out,
                                                          std::size_t entry_stride = PS2_PALETTE_ENTRY_STRIDE,
                                                          std::size_t count = PS2_PALETTE_ENTRIES);

// RGB triplets, the form surface::write_palette takes
[[nodiscard]] PS2TEX_EXPORT std::vector<std::uint8_t> palette_to_rgb(const palette& pal);

} // namespace ps2tex

#endif // PS2TEX_PALETTE_HPP_
