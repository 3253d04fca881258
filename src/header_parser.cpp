#include <ps2tex/header_parser.hpp>
#include <ps2tex/palette.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <cstdio>
#include <limits>

namespace ps2tex {

namespace {

constexpr std::size_t SIZE_PATTERN_LENGTH = 4;

constexpr field_spec STUDIO_HEADER_FIELDS[] = {
    {"id", 0, field_kind::u32_le},
    {"version", 4, field_kind::u32_le},
    {"name", 8, field_kind::ascii_z, 64},
    {"length", 72, field_kind::u32_le},
    {"eyeposition", 76, field_kind::vec3_f32_le},
    {"min", 88, field_kind::vec3_f32_le},
    {"max", 100, field_kind::vec3_f32_le},
    {"bbmin", 112, field_kind::vec3_f32_le},
    {"bbmax", 124, field_kind::vec3_f32_le},
    {"flags", 136, field_kind::u32_le},
    {"numbones", 140, field_kind::u32_le},
    {"boneindex", 144, field_kind::u32_le},
    {"numbonecontrollers", 148, field_kind::u32_le},
    {"bonecontrollerindex", 152, field_kind::u32_le},
    {"numhitboxes", 156, field_kind::u32_le},
    {"hitboxindex", 160, field_kind::u32_le},
    {"numseq", 164, field_kind::u32_le},
    {"seqindex", 168, field_kind::u32_le},
    {"numseqgroups", 172, field_kind::u32_le},
    {"seqgroupindex", 176, field_kind::u32_le},
    {"numtextures", 180, field_kind::u32_le},
    {"textureindex", 184, field_kind::u32_le},
    {"texturedataindex", 188, field_kind::u32_le},
    {"numskinref", 192, field_kind::u32_le},
    {"numskinfamilies", 196, field_kind::u32_le},
    {"skinindex", 200, field_kind::u32_le},
    {"numbodyparts", 204, field_kind::u32_le},
    {"bodypartindex", 208, field_kind::u32_le},
    {"numattachments", 212, field_kind::u32_le},
    {"attachmentindex", 216, field_kind::u32_le},
    {"soundtable", 220, field_kind::u32_le},
    {"soundindex", 224, field_kind::u32_le},
    {"soundgroups", 228, field_kind::u32_le},
    {"soundgroupindex", 232, field_kind::u32_le},
    {"numtransitions", 236, field_kind::u32_le},
    {"transitionindex", 240, field_kind::u32_le},
};

constexpr field_spec STUDIO_TEXTURE_FIELDS[] = {
    {"tex_name", 0, field_kind::ascii_z, STUDIO_TEXTURE_NAME_LENGTH},
    {"tex_flags", 64, field_kind::u32_le},
    {"tex_width", 68, field_kind::u32_le},
    {"tex_height", 72, field_kind::u32_le},
    {"tex_index", 76, field_kind::u32_le},
};

// Text up to the first NUL, ASCII only
std::string read_ascii_z(const std::uint8_t* p, std::size_t length) {
    std::string text;
    for (std::size_t i = 0; i < length && p[i] != 0; ++i) {
        if (p[i] < 0x80) {
            text.push_back(static_cast<char>(p[i]));
        }
    }
    return text;
}

std::size_t saturating_add(std::size_t a, std::size_t b) noexcept {
    return a > std::numeric_limits<std::size_t>::max() - b
        ? std::numeric_limits<std::size_t>::max()
        : a + b;
}

} // namespace

// ============================================================================
// Field Decoding
// ============================================================================

std::string format_value(const header_value& value) {
    if (const auto* number = std::get_if<std::uint32_t>(&value)) {
        return std::to_string(*number);
    }
    if (const auto* vec = std::get_if<std::array<float, 3>>(&value)) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "%.2f,%.2f,%.2f",
                      static_cast<double>((*vec)[0]),
                      static_cast<double>((*vec)[1]),
                      static_cast<double>((*vec)[2]));
        return buf;
    }
    return std::get<std::string>(value);
}

const header_field* parsed_header::find(std::string_view name) const noexcept {
    for (const auto& field : fields_) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

std::optional<std::uint32_t> parsed_header::u32(std::string_view name) const noexcept {
    const auto* field = find(name);
    if (!field) {
        return std::nullopt;
    }
    if (const auto* number = std::get_if<std::uint32_t>(&field->value)) {
        return *number;
    }
    return std::nullopt;
}

std::string parsed_header::text(std::string_view name) const {
    const auto* field = find(name);
    if (!field) {
        return {};
    }
    if (const auto* str = std::get_if<std::string>(&field->value)) {
        return *str;
    }
    return {};
}

decode_result parse_fixed_header(std::span<const std::uint8_t> buffer,
                                 std::span<const field_spec> layout,
                                 std::size_t base,
                                 parsed_header& out) {
    out.clear();

    for (const auto& spec : layout) {
        const std::size_t offset = saturating_add(base, spec.offset);
        const std::size_t size = field_size(spec);

        if (offset > buffer.size() || buffer.size() - offset < size) {
            out.clear();
            return decode_result::failure(decode_error::truncated_header,
                "Field '" + std::string(spec.name) + "' at " + hex_offset(offset) +
                " extends past end of data (" + std::to_string(buffer.size()) + " bytes)");
        }

        const auto* p = buffer.data() + offset;
        header_field field;
        field.name = spec.name;
        field.kind = spec.kind;
        field.offset = offset;

        switch (spec.kind) {
            case field_kind::u32_le:
                field.value = read_le32(p);
                break;
            case field_kind::vec3_f32_le:
                field.value = std::array<float, 3>{read_le_f32(p), read_le_f32(p + 4), read_le_f32(p + 8)};
                break;
            case field_kind::ascii_z:
                field.value = read_ascii_z(p, spec.length);
                break;
        }

        out.add(std::move(field));
    }

    return decode_result::success();
}

// ============================================================================
// StudioModel Container
// ============================================================================

std::span<const field_spec> studio_header_layout() noexcept {
    return STUDIO_HEADER_FIELDS;
}

std::span<const field_spec> studio_texture_layout() noexcept {
    return STUDIO_TEXTURE_FIELDS;
}

decode_result parse_texture_table(std::span<const std::uint8_t> buffer,
                                  const parsed_header& header,
                                  std::vector<texture_record>& records) {
    const auto num_textures = header.u32("numtextures");
    const auto texture_index = header.u32("textureindex");
    const auto texture_data_index = header.u32("texturedataindex");

    if (!num_textures || !texture_index || !texture_data_index) {
        return decode_result::failure(decode_error::invalid_format,
            "Header does not declare numtextures, textureindex and texturedataindex");
    }

    const std::size_t table_offset = *texture_index;
    const std::size_t count = *num_textures;

    if (table_offset > buffer.size() ||
        count > (buffer.size() - table_offset) / STUDIO_TEXTURE_STRIDE) {
        return decode_result::failure(decode_error::out_of_range,
            "Texture table of " + std::to_string(count) + " entries at " +
            hex_offset(table_offset) + " exceeds file size " + std::to_string(buffer.size()));
    }

    std::size_t data_offset = static_cast<std::size_t>(*texture_data_index) + STUDIO_TEXTURE_GAP;
    if (data_offset > buffer.size()) {
        return decode_result::failure(decode_error::out_of_range,
            "Texture data at " + hex_offset(*texture_data_index) + " lies outside the file");
    }

    records.reserve(records.size() + count);

    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t entry_offset = table_offset + i * STUDIO_TEXTURE_STRIDE;

        parsed_header entry;
        auto result = parse_fixed_header(buffer, studio_texture_layout(), entry_offset, entry);
        if (!result) {
            return result;
        }

        texture_record record;
        record.name = entry.text("tex_name");
        record.name_offset = entry_offset;
        record.flags = entry.u32("tex_flags").value_or(0);
        record.width = entry.u32("tex_width").value_or(0);
        record.height = entry.u32("tex_height").value_or(0);
        record.index_field = entry.u32("tex_index").value_or(0);

        const std::uint64_t pixel_count = static_cast<std::uint64_t>(record.width) * record.height;
        const std::size_t pixel_bytes = pixel_count > std::numeric_limits<std::size_t>::max()
            ? std::numeric_limits<std::size_t>::max()
            : static_cast<std::size_t>(pixel_count);

        record.data_offset = data_offset;
        record.palette_offset = data_offset;
        record.pixel_offset = saturating_add(data_offset, PS2_PALETTE_BYTES);
        record.end_offset = saturating_add(record.pixel_offset, pixel_bytes);

        data_offset = saturating_add(record.end_offset, STUDIO_TEXTURE_GAP);
        records.push_back(std::move(record));
    }

    return decode_result::success();
}

// ============================================================================
// Size Pattern
// ============================================================================

decode_result read_size_pattern(std::span<const std::uint8_t> buffer,
                                std::size_t sentinel_offset,
                                std::uint16_t& width,
                                std::uint16_t& height) {
    if (sentinel_offset < SIZE_PATTERN_LENGTH || sentinel_offset > buffer.size()) {
        return decode_result::failure(decode_error::truncated_header,
            "No size pattern before sentinel at " + hex_offset(sentinel_offset));
    }

    const auto* p = buffer.data() + sentinel_offset - SIZE_PATTERN_LENGTH;
    width = read_le16(p);
    height = read_le16(p + 2);
    return decode_result::success();
}

} // namespace ps2tex
