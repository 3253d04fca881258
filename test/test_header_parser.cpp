#include <doctest/doctest.h>
#include <ps2tex/ps2tex.hpp>

#include "helpers/synthetic.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

void put_f32(std::vector<std::uint8_t>& buf, std::size_t at, float v) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    test_data::put_le32(buf, at, bits);
}

constexpr ps2tex::field_spec SAMPLE_LAYOUT[] = {
    {"magic", 0, ps2tex::field_kind::u32_le},
    {"origin", 4, ps2tex::field_kind::vec3_f32_le},
    {"label", 16, ps2tex::field_kind::ascii_z, 8},
};

} // namespace

TEST_CASE("Header parser: fixed layouts") {
    std::vector<std::uint8_t> buf(32, 0);
    test_data::put_le32(buf, 8 + 0, 0xCAFEF00D);
    put_f32(buf, 8 + 4, 1.5f);
    put_f32(buf, 8 + 8, -2.0f);
    put_f32(buf, 8 + 12, 3.25f);
    const char label[] = "abc";
    std::memcpy(buf.data() + 8 + 16, label, 3);

    SUBCASE("Fields decode at base + offset") {
        ps2tex::parsed_header header;
        REQUIRE(ps2tex::parse_fixed_header(buf, SAMPLE_LAYOUT, 8, header).ok);
        REQUIRE(header.fields().size() == 3);

        CHECK(header.u32("magic") == std::optional<std::uint32_t>(0xCAFEF00D));
        CHECK(header.text("label") == "abc");

        const auto* origin = header.find("origin");
        REQUIRE(origin != nullptr);
        CHECK(origin->offset == 12);
        CHECK(ps2tex::format_value(origin->value) == "1.50,-2.00,3.25");
        CHECK(ps2tex::format_value(header.find("magic")->value) == std::to_string(0xCAFEF00Du));
    }

    SUBCASE("Lookups of the wrong kind or missing name") {
        ps2tex::parsed_header header;
        REQUIRE(ps2tex::parse_fixed_header(buf, SAMPLE_LAYOUT, 8, header).ok);
        CHECK_FALSE(header.u32("label").has_value());
        CHECK_FALSE(header.u32("nope").has_value());
        CHECK(header.text("magic").empty());
        CHECK(header.find("nope") == nullptr);
    }

    SUBCASE("A field past the end names itself") {
        ps2tex::parsed_header header;
        const auto result = ps2tex::parse_fixed_header(buf, SAMPLE_LAYOUT, 12, header);
        CHECK_FALSE(result.ok);
        CHECK(result.error == ps2tex::decode_error::truncated_header);
        CHECK(result.message.find("label") != std::string::npos);
    }

    SUBCASE("Base beyond the buffer") {
        ps2tex::parsed_header header;
        const auto result = ps2tex::parse_fixed_header(buf, SAMPLE_LAYOUT, 1000, header);
        CHECK(result.error == ps2tex::decode_error::truncated_header);
    }
}

TEST_CASE("Header parser: StudioModel layouts") {
    SUBCASE("Header layout covers 244 bytes") {
        const auto layout = ps2tex::studio_header_layout();
        CHECK(layout.size() == 36);
        std::size_t end = 0;
        for (const auto& spec : layout) {
            end = std::max(end, spec.offset + ps2tex::field_size(spec));
        }
        CHECK(end == ps2tex::STUDIO_HEADER_SIZE);
    }

    SUBCASE("Texture entry layout covers 80 bytes") {
        const auto layout = ps2tex::studio_texture_layout();
        CHECK(layout.size() == 5);
        std::size_t end = 0;
        for (const auto& spec : layout) {
            end = std::max(end, spec.offset + ps2tex::field_size(spec));
        }
        CHECK(end == ps2tex::STUDIO_TEXTURE_STRIDE);
    }

    SUBCASE("Texture table walk") {
        const auto buf = test_data::build_studio_model({
            {"WALL01.BMP", 16, 8, 3},
            {"floor", 4, 4, 0},
        });

        ps2tex::parsed_header header;
        REQUIRE(ps2tex::parse_fixed_header(buf, ps2tex::studio_header_layout(), 0, header).ok);
        CHECK(header.text("name") == "gman.mdl");
        CHECK(header.u32("numtextures") == std::optional<std::uint32_t>(2));

        std::vector<ps2tex::texture_record> records;
        REQUIRE(ps2tex::parse_texture_table(buf, header, records).ok);
        REQUIRE(records.size() == 2);

        const std::size_t blob = test_data::STUDIO_HEADER + 2 * test_data::STUDIO_ENTRY;
        const std::size_t first = blob + 32;
        CHECK(records[0].name == "WALL01.BMP");
        CHECK(records[0].flags == 3);
        CHECK(records[0].width == 16);
        CHECK(records[0].height == 8);
        CHECK(records[0].name_offset == test_data::STUDIO_HEADER);
        CHECK(records[0].palette_offset == first);
        CHECK(records[0].pixel_offset == first + 1024);
        CHECK(records[0].end_offset == first + 1024 + 16 * 8);
        CHECK(records[0].index_field == first);

        const std::size_t second = first + 1024 + 16 * 8 + 32;
        CHECK(records[1].name == "floor");
        CHECK(records[1].palette_offset == second);
        CHECK(records[1].pixel_offset == second + 1024);
    }

    SUBCASE("Table larger than the file") {
        auto buf = test_data::build_studio_model({{"a", 2, 2}});
        test_data::put_le32(buf, 180, 100000);

        ps2tex::parsed_header header;
        REQUIRE(ps2tex::parse_fixed_header(buf, ps2tex::studio_header_layout(), 0, header).ok);
        std::vector<ps2tex::texture_record> records;
        const auto result = ps2tex::parse_texture_table(buf, header, records);
        CHECK(result.error == ps2tex::decode_error::out_of_range);
    }

    SUBCASE("Data blob outside the file") {
        auto buf = test_data::build_studio_model({{"a", 2, 2}});
        test_data::put_le32(buf, 188, 0xFFFFFF00u);

        ps2tex::parsed_header header;
        REQUIRE(ps2tex::parse_fixed_header(buf, ps2tex::studio_header_layout(), 0, header).ok);
        std::vector<ps2tex::texture_record> records;
        const auto result = ps2tex::parse_texture_table(buf, header, records);
        CHECK(result.error == ps2tex::decode_error::out_of_range);
    }

    SUBCASE("Header without texture fields") {
        ps2tex::parsed_header header;
        std::vector<ps2tex::texture_record> records;
        const auto result = ps2tex::parse_texture_table({}, header, records);
        CHECK(result.error == ps2tex::decode_error::invalid_format);
    }
}

TEST_CASE("Header parser: size pattern") {
    const std::vector<std::uint8_t> buf = {0x40, 0x00, 0x20, 0x01, 0xFF, 0xFF, 0xFF, 0x80};

    SUBCASE("Width and height precede the sentinel") {
        std::uint16_t w = 0;
        std::uint16_t h = 0;
        REQUIRE(ps2tex::read_size_pattern(buf, 4, w, h).ok);
        CHECK(w == 64);
        CHECK(h == 288);
    }

    SUBCASE("Sentinel too close to the start") {
        std::uint16_t w = 0;
        std::uint16_t h = 0;
        const auto result = ps2tex::read_size_pattern(buf, 2, w, h);
        CHECK(result.error == ps2tex::decode_error::truncated_header);
    }
}
