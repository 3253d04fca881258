#pragma once

// Builders for synthetic texture containers used across the tests.

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace test_data {

inline void put_le16(std::vector<std::uint8_t>& buf, std::size_t at, std::uint16_t v) {
    buf[at] = static_cast<std::uint8_t>(v & 0xFF);
    buf[at + 1] = static_cast<std::uint8_t>(v >> 8);
}

inline void put_le32(std::vector<std::uint8_t>& buf, std::size_t at, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf[at + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

// Palette entry i of the marker-scan builder. Entry 0 is the sentinel itself.
inline std::array<std::uint8_t, 3> marker_palette_color(std::size_t i) {
    if (i == 0) {
        return {0xFF, 0xFF, 0xFF};
    }
    return {static_cast<std::uint8_t>(i),
            static_cast<std::uint8_t>((i * 2) & 0xFF),
            static_cast<std::uint8_t>((i * 3) & 0xFF)};
}

// Index stored at (x, y) by both builders
inline std::uint8_t pixel_index(int x, int y, int width, std::uint8_t seed) {
    return static_cast<std::uint8_t>((seed + x + y * width) & 0xFF);
}

struct marker_offsets {
    std::size_t name = 0;
    std::size_t sentinel = 0;
};

/**
 * Append one marker-scan record:
 * name, 00 00 00, width u16, height u16, FF FF FF 80, 1020 palette bytes,
 * then pixel_bytes index bytes (width * height when negative).
 */
inline marker_offsets append_marker_record(std::vector<std::uint8_t>& buf,
                                           std::string_view name,
                                           std::uint16_t width,
                                           std::uint16_t height,
                                           std::uint8_t seed = 1,
                                           long pixel_bytes = -1) {
    marker_offsets at;
    at.name = buf.size();
    buf.insert(buf.end(), name.begin(), name.end());
    buf.insert(buf.end(), 3, 0);

    const std::size_t size_at = buf.size();
    buf.resize(buf.size() + 4);
    put_le16(buf, size_at, width);
    put_le16(buf, size_at + 2, height);

    at.sentinel = buf.size();
    for (std::size_t i = 0; i < 256; ++i) {
        const auto c = marker_palette_color(i);
        buf.insert(buf.end(), c.begin(), c.end());
        buf.push_back(0x80);
    }

    const long total = static_cast<long>(width) * height;
    const long count = pixel_bytes < 0 ? total : pixel_bytes;
    for (long i = 0; i < count; ++i) {
        const int x = static_cast<int>(i % width);
        const int y = static_cast<int>(i / width);
        buf.push_back(pixel_index(x, y, width, seed));
    }
    return at;
}

struct studio_texture {
    std::string name;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t flags = 0;
    std::uint8_t seed = 1;
};

constexpr std::size_t STUDIO_HEADER = 244;
constexpr std::size_t STUDIO_ENTRY = 80;
constexpr std::size_t STUDIO_GAP = 32;

/**
 * Build a StudioModel container: header, texture table right after it, then
 * the data blob. Palette entry i is stored as (i, i, i, 0x80) in stored
 * (swizzled) order. truncate_by removes bytes from the end.
 */
inline std::vector<std::uint8_t> build_studio_model(const std::vector<studio_texture>& textures,
                                                    std::size_t truncate_by = 0) {
    const std::size_t table = STUDIO_HEADER;
    const std::size_t blob = table + textures.size() * STUDIO_ENTRY;

    std::size_t size = blob + STUDIO_GAP;
    for (const auto& t : textures) {
        size += 1024 + static_cast<std::size_t>(t.width) * t.height + STUDIO_GAP;
    }

    std::vector<std::uint8_t> buf(size, 0);
    put_le32(buf, 0, 0x54534449);  // "IDST"
    put_le32(buf, 4, 10);
    const std::string model_name = "gman.mdl";
    std::copy(model_name.begin(), model_name.end(), buf.begin() + 8);
    put_le32(buf, 72, static_cast<std::uint32_t>(size));
    put_le32(buf, 180, static_cast<std::uint32_t>(textures.size()));
    put_le32(buf, 184, static_cast<std::uint32_t>(table));
    put_le32(buf, 188, static_cast<std::uint32_t>(blob));

    std::size_t data = blob + STUDIO_GAP;
    for (std::size_t i = 0; i < textures.size(); ++i) {
        const auto& t = textures[i];
        const std::size_t entry = table + i * STUDIO_ENTRY;
        std::copy(t.name.begin(), t.name.end(), buf.begin() + static_cast<std::ptrdiff_t>(entry));
        put_le32(buf, entry + 64, t.flags);
        put_le32(buf, entry + 68, t.width);
        put_le32(buf, entry + 72, t.height);
        put_le32(buf, entry + 76, static_cast<std::uint32_t>(data));

        for (std::size_t c = 0; c < 256; ++c) {
            const auto v = static_cast<std::uint8_t>(c);
            buf[data + c * 4 + 0] = v;
            buf[data + c * 4 + 1] = v;
            buf[data + c * 4 + 2] = v;
            buf[data + c * 4 + 3] = 0x80;
        }
        data += 1024;

        for (std::uint32_t y = 0; y < t.height; ++y) {
            for (std::uint32_t x = 0; x < t.width; ++x) {
                buf[data++] = pixel_index(static_cast<int>(x), static_cast<int>(y),
                                          static_cast<int>(t.width), t.seed);
            }
        }
        data += STUDIO_GAP;
    }

    buf.resize(buf.size() - truncate_by);
    return buf;
}

// Linear CLUT index whose color a stored index shows after GS unswizzling
inline std::size_t unswizzled(std::size_t i) {
    const std::size_t r = i % 32;
    if (r >= 8 && r < 16) return i + 8;
    if (r >= 16 && r < 24) return i - 8;
    return i;
}

// Fresh directory removed on destruction
class scoped_temp_dir {
public:
    scoped_temp_dir() {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("ps2tex_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~scoped_temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    scoped_temp_dir(const scoped_temp_dir&) = delete;
    scoped_temp_dir& operator=(const scoped_temp_dir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace test_data
