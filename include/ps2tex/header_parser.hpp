#ifndef PS2TEX_HEADER_PARSER_HPP_
#define PS2TEX_HEADER_PARSER_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/texture_record.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ps2tex {

// ============================================================================
// Field Layouts
// ============================================================================

enum class field_kind {
    u32_le,       // unsigned 32-bit little-endian
    vec3_f32_le,  // three float32 little-endian
    ascii_z       // fixed-length, NUL-terminated ASCII
};

struct field_spec {
    std::string_view name;
    std::size_t offset = 0;
    field_kind kind = field_kind::u32_le;
    std::size_t length = 0;  // ascii_z only
};

// Bytes a field occupies in the buffer
[[nodiscard]] constexpr std::size_t field_size(const field_spec& spec) noexcept {
    switch (spec.kind) {
        case field_kind::u32_le:      return 4;
        case field_kind::vec3_f32_le: return 12;
        case field_kind::ascii_z:     return spec.length;
    }
    return 0;
}

using header_value = std::variant<std::uint32_t, std::array<float, 3>, std::string>;

struct header_field {
    std::string_view name;
    field_kind kind = field_kind::u32_le;
    std::size_t offset = 0;  // absolute
    header_value value;
};

// Display form: decimal integers, "x,y,z" vectors with two decimals, raw strings
[[nodiscard]] PS2TEX_EXPORT std::string format_value(const header_value& value);

class PS2TEX_EXPORT parsed_header {
public:
    [[nodiscard]] const std::vector<header_field>& fields() const noexcept { return fields_; }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const header_field* find(std::string_view name) const noexcept;

    // Value of a u32 field, or std::nullopt if missing or of another kind
    [[nodiscard]] std::optional<std::uint32_t> u32(std::string_view name) const noexcept;

    // Value of an ascii_z field, or empty
    [[nodiscard]] std::string text(std::string_view name) const;

    void add(header_field field) { fields_.push_back(std::move(field)); }
    void clear() noexcept { fields_.clear(); }

private:
    std::vector<header_field> fields_;
};

/**
 * Decode every field of a layout.
 * @param buffer Whole input file
 * @param layout Field table, offsets relative to base
 * @param base Absolute offset of the structure
 * @param out Receives the fields in layout order (cleared first)
 * @return truncated_header naming the first field that does not fit
 */
[[nodiscard]] PS2TEX_EXPORT decode_result parse_fixed_header(std::span<const std::uint8_t> buffer,
                                                             std::span<const field_spec> layout,
                                                             std::size_t base,
                                                             parsed_header& out);

// ============================================================================
// StudioModel Container
// ============================================================================

constexpr std::size_t STUDIO_HEADER_SIZE = 244;
constexpr std::size_t STUDIO_TEXTURE_STRIDE = 80;
constexpr std::size_t STUDIO_TEXTURE_NAME_LENGTH = 64;

// Bytes between texturedataindex and the first texture, and between textures
constexpr std::size_t STUDIO_TEXTURE_GAP = 32;

// Model header layout (id, version, name, bounds, section counts and offsets)
[[nodiscard]] PS2TEX_EXPORT std::span<const field_spec> studio_header_layout() noexcept;

// Texture table entry layout (name, flags, width, height, index)
[[nodiscard]] PS2TEX_EXPORT std::span<const field_spec> studio_texture_layout() noexcept;

/**
 * Walk the texture table a parsed model header declares.
 * @param buffer Whole input file
 * @param header Result of parsing studio_header_layout() at offset 0
 * @param records Receives one record per table entry, in table order
 * @return out_of_range if the table or the data blob start lies outside the buffer
 */
[[nodiscard]] PS2TEX_EXPORT decode_result parse_texture_table(std::span<const std::uint8_t> buffer,
                                                              const parsed_header& header,
                                                              std::vector<texture_record>& records);

// ============================================================================
// Size Pattern
// ============================================================================

/**
 * Read the 4-byte size pattern preceding a texture data sentinel.
 * width = LE u16 at sentinel - 4, height = LE u16 at sentinel - 2.
 * @return truncated_header if fewer than 4 bytes precede the sentinel
 */
[[nodiscard]] PS2TEX_EXPORT decode_result read_size_pattern(std::span<const std::uint8_t> buffer,
                                                            std::size_t sentinel_offset,
                                                            std::uint16_t& width,
                                                            std::uint16_t& height);

} // namespace ps2tex

#endif // PS2TEX_HEADER_PARSER_HPP_
