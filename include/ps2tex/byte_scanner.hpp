#ifndef PS2TEX_BYTE_SCANNER_HPP_
#define PS2TEX_BYTE_SCANNER_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/texture_record.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ps2tex {

// ============================================================================
// Byte Pattern Search
// ============================================================================

/**
 * Find the first exact occurrence of a byte pattern at or after an offset.
 * @param buffer Buffer to search
 * @param pattern Bytes to look for
 * @param from Absolute offset to start at
 * @return Offset of the match, or std::nullopt when there is none
 */
[[nodiscard]] PS2TEX_EXPORT std::optional<std::size_t> find_next(std::span<const std::uint8_t> buffer,
                                                                  std::span<const std::uint8_t> pattern,
                                                                  std::size_t from) noexcept;

// ASCII text as a byte pattern
[[nodiscard]] inline std::span<const std::uint8_t> as_bytes(std::string_view text) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

// ============================================================================
// Texture Names
// ============================================================================

struct extracted_name {
    std::string text;
    std::size_t end = 0;  // offset of the terminating zero run
};

/**
 * Read the name that starts at a matched marker.
 * The name runs from the marker up to the first run of three zero bytes.
 * @param buffer Source buffer
 * @param marker_offset Offset of the matched marker (first byte of the name)
 * @param marker_size Length of the marker
 */
[[nodiscard]] PS2TEX_EXPORT extracted_name extract_name(std::span<const std::uint8_t> buffer,
                                                        std::size_t marker_offset,
                                                        std::size_t marker_size);

/**
 * Decode raw name bytes as ASCII for use as a file name.
 * Bytes >= 0x80 are dropped and NUL bytes become '_'.
 */
[[nodiscard]] PS2TEX_EXPORT std::string sanitize_name(std::span<const std::uint8_t> raw);

// Names ending in ".BMP" are sibling file names, not texture data
[[nodiscard]] PS2TEX_EXPORT bool is_embedded_filename(std::string_view name) noexcept;

// ============================================================================
// Record Enumeration
// ============================================================================

/**
 * Enumerate marker-delimited texture records, left to right.
 * Stops when no further marker, or no sentinel after a name, is found.
 * Dimensions come from the size pattern before each sentinel; pixel
 * bounds are checked when the record is decoded.
 * @param buffer Whole input file
 * @param options name_marker and data_sentinel select the patterns
 * @param records Receives the discovered records
 * @return invalid_format if a pattern is empty, success otherwise
 */
[[nodiscard]] PS2TEX_EXPORT decode_result scan_records(std::span<const std::uint8_t> buffer,
                                                       const decode_options& options,
                                                       std::vector<texture_record>& records);

} // namespace ps2tex

#endif // PS2TEX_BYTE_SCANNER_HPP_
