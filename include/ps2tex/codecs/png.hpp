#ifndef PS2TEX_CODECS_PNG_HPP_
#define PS2TEX_CODECS_PNG_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace ps2tex {

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a memory surface to PNG format.
 * indexed8 surfaces are written as 8-bit palette PNGs, rgb888 as RGB PNGs.
 * @param surf Source surface
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] PS2TEX_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Encode a memory surface as an 8-bit palette PNG, re-quantizing
 * true-color input to 256 colors first.
 * @param surf Source surface
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] PS2TEX_EXPORT std::vector<std::uint8_t> encode_png8(const memory_surface& surf);

/**
 * Save a memory surface to a PNG file.
 * @param surf Source surface
 * @param path Output file path
 * @return io_error carrying the path if the file cannot be written
 */
[[nodiscard]] PS2TEX_EXPORT decode_result save_png(const memory_surface& surf,
                                                   const std::filesystem::path& path);

/**
 * Save a memory surface to an 8-bit palette PNG file.
 * @param surf Source surface
 * @param path Output file path
 * @return io_error carrying the path if the file cannot be written
 */
[[nodiscard]] PS2TEX_EXPORT decode_result save_png8(const memory_surface& surf,
                                                    const std::filesystem::path& path);

} // namespace ps2tex

#endif // PS2TEX_CODECS_PNG_HPP_
