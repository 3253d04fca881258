#ifndef PS2TEX_IMAGE_ASSEMBLER_HPP_
#define PS2TEX_IMAGE_ASSEMBLER_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>
#include <ps2tex/palette.hpp>
#include <ps2tex/pixel_decoder.hpp>

namespace ps2tex {

// ============================================================================
// Image Assembly
// ============================================================================

/**
 * Write an index grid and its palette to a surface as an indexed8 image.
 * Indices without a palette entry fail under palette_index_policy::strict and
 * are reduced modulo the palette size under palette_index_policy::wrap.
 * @param grid Decoded indices
 * @param pal Palette the indices refer to (1 to 256 entries)
 * @param surf Destination surface
 * @param options index_policy selects the out-of-range behavior
 */
[[nodiscard]] PS2TEX_EXPORT decode_result assemble(const index_grid& grid,
                                                   const palette& pal,
                                                   surface& surf,
                                                   const decode_options& options = {});

/**
 * Resolve every index through the palette and write an rgb888 image.
 * Same index policy as assemble().
 */
[[nodiscard]] PS2TEX_EXPORT decode_result flatten(const index_grid& grid,
                                                  const palette& pal,
                                                  surface& surf,
                                                  const decode_options& options = {});

/**
 * Flatten an assembled indexed8 surface to rgb888.
 * An rgb888 input is copied unchanged.
 */
[[nodiscard]] PS2TEX_EXPORT decode_result flatten(const memory_surface& image,
                                                  surface& surf,
                                                  const decode_options& options = {});

/**
 * Reduce a true-color image to an indexed8 image of at most max_colors colors.
 * Images that already use no more than max_colors distinct colors get an exact
 * palette in first-use order; others are reduced by median cut.
 * An indexed8 input is copied unchanged.
 * @param image Source image
 * @param surf Destination surface
 * @param max_colors Palette size limit (1 to 256)
 */
[[nodiscard]] PS2TEX_EXPORT decode_result quantize_adaptive(const memory_surface& image,
                                                            surface& surf,
                                                            int max_colors = 256);

} // namespace ps2tex

#endif // PS2TEX_IMAGE_ASSEMBLER_HPP_
