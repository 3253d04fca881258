#ifndef PS2TEX_SOURCES_STUDIO_MODEL_HPP_
#define PS2TEX_SOURCES_STUDIO_MODEL_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>
#include <ps2tex/header_parser.hpp>
#include <ps2tex/texture_record.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ps2tex {

// ============================================================================
// StudioModel Source
// ============================================================================
//
// PS2 StudioModel containers. The header at offset 0 declares a table of
// 80-byte texture entries and a data blob; every texture in the blob is a
// 1024-byte GS-swizzled palette followed by width * height index bytes, with
// 32 bytes between textures.

class PS2TEX_EXPORT studio_model_source {
public:
    static constexpr std::string_view name = "studio";
    static constexpr std::string_view extensions[] = {".dol", ".mdl"};

    /**
     * Check if data starts with a header whose texture table fits the data.
     * @param data Raw file data
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Parse the model header.
     * @param data Raw file data
     * @param header Receives all header fields
     */
    [[nodiscard]] static decode_result read_header(std::span<const std::uint8_t> data,
                                                   parsed_header& header);

    /**
     * Parse the header and list the texture table in order.
     * @param data Raw file data
     * @param records Receives the records
     */
    [[nodiscard]] static decode_result scan(std::span<const std::uint8_t> data,
                                            std::vector<texture_record>& records);

    /**
     * Decode one record to an indexed8 surface.
     * The palette is unswizzled unless options.ps2_palette_swizzle is false.
     * @param data Raw file data
     * @param record Record from scan()
     * @param surf Destination surface
     * @param options Decode options
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              const texture_record& record,
                                              surface& surf,
                                              const decode_options& options = {});

    // Lowercased name without a ".bmp" suffix, or "texture_<index>" if empty
    [[nodiscard]] static std::string export_stem(const texture_record& record, std::size_t index);
};

} // namespace ps2tex

#endif // PS2TEX_SOURCES_STUDIO_MODEL_HPP_
