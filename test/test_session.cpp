#include <doctest/doctest.h>
#include <ps2tex/ps2tex.hpp>

#include "helpers/image_readers.hpp"
#include "helpers/synthetic.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

std::vector<std::uint8_t> two_marker_records(long second_pixel_bytes = -1) {
    std::vector<std::uint8_t> buf(256, 0);
    test_data::append_marker_record(buf, "psx_brick", 4, 4, 1);
    test_data::append_marker_record(buf, "psx_grass", 6, 2, 20, second_pixel_bytes);
    return buf;
}

void write_input(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

} // namespace

TEST_CASE("Session: loading") {
    test_data::scoped_temp_dir dir;

    SUBCASE("Marker-scan file from disk") {
        const auto input = dir.path() / "SLUS_000.00";
        write_input(input, two_marker_records());

        ps2tex::session s;
        REQUIRE(s.load(input).ok);
        CHECK(s.loaded());
        CHECK(s.source()->name() == "marker");
        CHECK(s.header().empty());
        REQUIRE(s.textures().size() == 2);
        CHECK(s.textures()[0].name == "psx_brick");
        CHECK(s.textures()[1].name == "psx_grass");
    }

    SUBCASE("StudioModel bytes") {
        ps2tex::session s;
        REQUIRE(s.load(test_data::build_studio_model({{"A.BMP", 2, 2}, {"B", 2, 2}})).ok);
        CHECK(s.source()->name() == "studio");
        CHECK(s.header().text("name") == "gman.mdl");
        CHECK(s.textures().size() == 2);
    }

    SUBCASE("Missing file") {
        ps2tex::session s;
        const auto result = s.load(dir.path() / "missing.dol");
        CHECK(result.error == ps2tex::decode_error::io_error);
        CHECK_FALSE(s.loaded());
    }

    SUBCASE("File over the size limit") {
        const auto input = dir.path() / "big.dol";
        write_input(input, two_marker_records());

        ps2tex::decode_options options;
        options.max_file_size = 100;
        ps2tex::session s;
        CHECK(s.load(input, options).error == ps2tex::decode_error::io_error);
    }

    SUBCASE("Unrecognized data") {
        ps2tex::session s;
        CHECK(s.load(std::vector<std::uint8_t>(512, 0x42)).error == ps2tex::decode_error::invalid_format);
        CHECK(s.load(two_marker_records(), {}, "nope").error == ps2tex::decode_error::invalid_format);
    }

    SUBCASE("Forced source without textures") {
        ps2tex::session s;
        const auto result = s.load(std::vector<std::uint8_t>(512, 0x42), {}, "marker");
        CHECK(result.error == ps2tex::decode_error::pattern_not_found);
        CHECK_FALSE(s.loaded());
    }

    SUBCASE("A failed load clears the previous one") {
        ps2tex::session s;
        REQUIRE(s.load(two_marker_records()).ok);
        CHECK_FALSE(s.load(std::vector<std::uint8_t>(16, 0)).ok);
        CHECK_FALSE(s.loaded());
        CHECK(s.textures().empty());
    }
}

TEST_CASE("Session: decoding") {
    ps2tex::session s;
    REQUIRE(s.load(two_marker_records()).ok);

    SUBCASE("Indexed image") {
        ps2tex::memory_surface surf;
        REQUIRE(s.get_image(1, surf).ok);
        CHECK(surf.width() == 6);
        CHECK(surf.height() == 2);
        CHECK(*surf.pixel_at(0, 0) == 20);
    }

    SUBCASE("Flattened image") {
        ps2tex::memory_surface surf;
        REQUIRE(s.get_flattened(1, surf).ok);
        CHECK(surf.format() == ps2tex::pixel_format::rgb888);
        const auto c = test_data::marker_palette_color(20);
        CHECK(surf.pixel_at(0, 0)[0] == c[0]);
        CHECK(surf.pixel_at(0, 0)[1] == c[1]);
        CHECK(surf.pixel_at(0, 0)[2] == c[2]);
    }

    SUBCASE("Index past the end") {
        ps2tex::memory_surface surf;
        CHECK(s.get_image(2, surf).error == ps2tex::decode_error::out_of_range);
    }

    SUBCASE("Nothing loaded") {
        ps2tex::session empty;
        ps2tex::memory_surface surf;
        CHECK_FALSE(empty.get_image(0, surf).ok);
        CHECK(empty.export_name(0, ps2tex::export_format::bmp).empty());
    }
}

TEST_CASE("Session: exporting marker-scan textures") {
    test_data::scoped_temp_dir dir;
    const auto out = dir.path() / "out";

    SUBCASE("Every record becomes an indexed BMP") {
        ps2tex::session s;
        REQUIRE(s.load(two_marker_records()).ok);
        CHECK(s.export_name(0, ps2tex::export_format::bmp) == "psx_brick.bmp");

        const auto report = s.save_all(out);
        CHECK(report.saved_count() == 2);
        CHECK(report.all_saved());

        const auto bmp = test_data::read_bytes(out / "psx_brick.bmp");
        REQUIRE(bmp.size() > 54);
        CHECK(bmp[28] == 8);

        const auto image = test_data::read_bmp(bmp);
        REQUIRE(image.width == 4);
        REQUIRE(image.height == 4);
        for (int y = 0; y < 4; ++y) {
            for (int x = 0; x < 4; ++x) {
                const auto c = test_data::marker_palette_color(test_data::pixel_index(x, y, 4, 1));
                CHECK(image.at(x, y)[0] == c[0]);
                CHECK(image.at(x, y)[1] == c[1]);
                CHECK(image.at(x, y)[2] == c[2]);
            }
        }

        CHECK(std::filesystem::exists(out / "psx_grass.bmp"));
    }

    SUBCASE("A truncated record fails without stopping the batch") {
        ps2tex::session s;
        REQUIRE(s.load(two_marker_records(5)).ok);

        const auto report = s.save_all(out);
        REQUIRE(report.outcomes.size() == 2);
        CHECK(report.saved_count() == 1);
        CHECK(report.failed_count() == 1);
        CHECK_FALSE(report.all_saved());

        CHECK(report.outcomes[0].result.ok);
        CHECK(report.outcomes[0].path == out / "psx_brick.bmp");
        CHECK(std::filesystem::exists(out / "psx_brick.bmp"));

        CHECK(report.outcomes[1].name == "psx_grass");
        CHECK(report.outcomes[1].result.error == ps2tex::decode_error::truncated_pixel_data);
        CHECK_FALSE(std::filesystem::exists(out / "psx_grass.bmp"));
    }

    SUBCASE("Repeated names do not overwrite each other") {
        std::vector<std::uint8_t> buf(256, 0);
        test_data::append_marker_record(buf, "psx_dup", 2, 2, 1);
        test_data::append_marker_record(buf, "psx_dup", 2, 2, 9);

        ps2tex::session s;
        REQUIRE(s.load(buf).ok);
        const auto report = s.save_all(out);
        CHECK(report.saved_count() == 2);
        CHECK(std::filesystem::exists(out / "psx_dup.bmp"));
        CHECK(std::filesystem::exists(out / "psx_dup_1.bmp"));
    }

    SUBCASE("A suffixed name already taken by another record is skipped") {
        std::vector<std::uint8_t> buf(256, 0);
        test_data::append_marker_record(buf, "psx_a", 2, 2, 1);
        test_data::append_marker_record(buf, "psx_a_2", 2, 2, 5);
        test_data::append_marker_record(buf, "psx_a", 2, 2, 9);

        ps2tex::session s;
        REQUIRE(s.load(buf).ok);
        const auto report = s.save_all(out);
        REQUIRE(report.outcomes.size() == 3);
        CHECK(report.saved_count() == 3);

        CHECK(report.outcomes[0].path == out / "psx_a.bmp");
        CHECK(report.outcomes[1].path == out / "psx_a_2.bmp");
        CHECK(report.outcomes[2].path == out / "psx_a_2_1.bmp");

        std::size_t files = 0;
        for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(out)) {
            ++files;
        }
        CHECK(files == 3);

        // Each file keeps its own record's pixels
        const auto second = test_data::read_bmp(test_data::read_bytes(out / "psx_a_2.bmp"));
        REQUIRE(second.width == 2);
        const auto c = test_data::marker_palette_color(5);
        CHECK(second.at(0, 0)[0] == c[0]);
        CHECK(second.at(0, 0)[1] == c[1]);
    }
}

TEST_CASE("Session: exporting StudioModel textures") {
    test_data::scoped_temp_dir dir;

    ps2tex::session s;
    REQUIRE(s.load(test_data::build_studio_model({{"WALL01.BMP", 8, 4, 0, 0}, {"", 2, 2}})).ok);
    CHECK(s.export_name(0, ps2tex::export_format::png8) == "wall01.png");
    CHECK(s.export_name(1, ps2tex::export_format::png8) == "texture_1.png");

    SUBCASE("Default export is a palette PNG") {
        const auto report = s.save_all(dir.path());
        REQUIRE(report.all_saved());

        const auto png = test_data::read_png(test_data::read_bytes(dir.path() / "wall01.png"));
        REQUIRE(png.image.width == 8);
        REQUIRE(png.image.height == 4);
        CHECK(png.palette_color_type);
        CHECK(png.bit_depth == 8);
        CHECK(png.palette_size <= 256);

        for (int y = 0; y < 4; ++y) {
            for (int x = 0; x < 8; ++x) {
                const auto stored = test_data::pixel_index(x, y, 8, 0);
                const auto gray = static_cast<std::uint8_t>(test_data::unswizzled(stored));
                CHECK(png.image.at(x, y)[0] == gray);
                CHECK(png.image.at(x, y)[2] == gray);
            }
        }
    }

    SUBCASE("BMP on request") {
        const auto outcome = s.save_one(0, dir.path() / "wall.bmp", ps2tex::export_format::bmp);
        REQUIRE(outcome.result.ok);
        const auto image = test_data::read_bmp(test_data::read_bytes(outcome.path));
        REQUIRE(image.width == 8);
        CHECK(image.at(1, 0)[1] == 1);
        CHECK(image.at(0, 1)[1] == 16);
    }

    SUBCASE("Unwritable destination") {
        const auto blocker = dir.path() / "file";
        write_input(blocker, {1});
        const auto outcome = s.save_one(0, blocker / "x.png", ps2tex::export_format::png8);
        CHECK(outcome.result.error == ps2tex::decode_error::io_error);
        CHECK(outcome.path.empty());
        CHECK(outcome.result.message.find("x.png") != std::string::npos);
    }
}
