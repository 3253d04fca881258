#ifndef PS2TEX_SOURCES_MARKER_SCAN_HPP_
#define PS2TEX_SOURCES_MARKER_SCAN_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>
#include <ps2tex/texture_record.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ps2tex {

// ============================================================================
// Marker-Scan Source
// ============================================================================
//
// Textures embedded in an executable without a directory. Each record is
// [name starting with the marker] ... [width u16][height u16]
// [sentinel FF FF FF 80 = palette entry 0][rest of 1024-byte RGBA palette]
// [width * height index bytes], and runs until the next marker.

class PS2TEX_EXPORT marker_scan_source {
public:
    static constexpr std::string_view name = "marker";
    static constexpr std::string_view extensions[] = {".dol", ".elf", ".bin"};

    /**
     * Check if data contains at least one marker followed by a sentinel.
     * @param data Raw file data
     * @param options name_marker and data_sentinel
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data,
                                    const decode_options& options) noexcept;

    /**
     * Enumerate texture records left to right.
     * @param data Raw file data
     * @param records Receives the records
     * @param options Decode options
     */
    [[nodiscard]] static decode_result scan(std::span<const std::uint8_t> data,
                                            std::vector<texture_record>& records,
                                            const decode_options& options = {});

    /**
     * Decode one record to an indexed8 surface. The palette is flat RGBA.
     * @param data Raw file data
     * @param record Record from scan()
     * @param surf Destination surface
     * @param options Decode options
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              const texture_record& record,
                                              surface& surf,
                                              const decode_options& options = {});

    // "<sanitized name>"
    [[nodiscard]] static std::string export_stem(const texture_record& record, std::size_t index);
};

} // namespace ps2tex

#endif // PS2TEX_SOURCES_MARKER_SCAN_HPP_
