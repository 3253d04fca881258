#ifndef PS2TEX_CODECS_BMP_HPP_
#define PS2TEX_CODECS_BMP_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace ps2tex {

// ============================================================================
// BMP Encoder Functions
// ============================================================================

/**
 * Encode a memory surface as an uncompressed Windows BMP.
 * indexed8 surfaces become 8-bit BMPs with a 256-entry color table,
 * rgb888 surfaces become 24-bit BMPs. Rows are stored bottom-up.
 * @param surf Source surface
 * @return BMP-encoded data, or empty vector on failure
 */
[[nodiscard]] PS2TEX_EXPORT std::vector<std::uint8_t> encode_bmp(const memory_surface& surf);

/**
 * Save a memory surface to a BMP file.
 * @param surf Source surface
 * @param path Output file path
 * @return io_error carrying the path if the file cannot be written
 */
[[nodiscard]] PS2TEX_EXPORT decode_result save_bmp(const memory_surface& surf,
                                                   const std::filesystem::path& path);

} // namespace ps2tex

#endif // PS2TEX_CODECS_BMP_HPP_
