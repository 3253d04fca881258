#include <ps2tex/image_assembler.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace ps2tex {

namespace {

constexpr std::size_t MAX_PALETTE_ENTRIES = 256;

decode_result check_inputs(const index_grid& grid, const palette& pal) {
    if (grid.empty()) {
        return decode_result::failure(decode_error::invalid_format, "Empty index grid");
    }
    if (pal.empty() || pal.size() > MAX_PALETTE_ENTRIES) {
        return decode_result::failure(decode_error::invalid_format,
            "Palette must have 1 to 256 entries, has " + std::to_string(pal.size()));
    }
    return decode_result::success();
}

// Map one index through the policy; false if it has no entry under strict
bool resolve_index(std::uint8_t index, std::size_t palette_size,
                   palette_index_policy policy, std::uint8_t& resolved) {
    if (index < palette_size) {
        resolved = index;
        return true;
    }
    if (policy == palette_index_policy::wrap) {
        resolved = static_cast<std::uint8_t>(index % palette_size);
        return true;
    }
    return false;
}

decode_result index_error(int x, int y, std::uint8_t index, std::size_t palette_size) {
    return decode_result::failure(decode_error::palette_index_out_of_range,
        "Index " + std::to_string(index) + " at (" + std::to_string(x) + ", " +
        std::to_string(y) + ") exceeds palette of " + std::to_string(palette_size) + " entries");
}

// ----------------------------------------------------------------------------
// Median cut
// ----------------------------------------------------------------------------

struct color_count {
    std::array<std::uint8_t, 3> rgb{};
    std::uint32_t count = 0;
};

struct color_box {
    std::size_t begin = 0;
    std::size_t end = 0;
};

std::uint32_t pack_rgb(const std::uint8_t* p) noexcept {
    return (static_cast<std::uint32_t>(p[0]) << 16) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           static_cast<std::uint32_t>(p[2]);
}

// Widest channel of a box and its extent
std::pair<int, int> widest_channel(const std::vector<color_count>& colors, const color_box& box) {
    std::array<int, 3> lo = {255, 255, 255};
    std::array<int, 3> hi = {0, 0, 0};
    for (std::size_t i = box.begin; i < box.end; ++i) {
        for (int c = 0; c < 3; ++c) {
            lo[c] = std::min<int>(lo[c], colors[i].rgb[c]);
            hi[c] = std::max<int>(hi[c], colors[i].rgb[c]);
        }
    }
    int channel = 0;
    for (int c = 1; c < 3; ++c) {
        if (hi[c] - lo[c] > hi[channel] - lo[channel]) {
            channel = c;
        }
    }
    return {channel, hi[channel] - lo[channel]};
}

std::vector<color_box> median_cut(std::vector<color_count>& colors, std::size_t max_boxes) {
    std::vector<color_box> boxes = {{0, colors.size()}};

    while (boxes.size() < max_boxes) {
        std::size_t best = boxes.size();
        int best_range = 0;
        int best_channel = 0;
        for (std::size_t b = 0; b < boxes.size(); ++b) {
            if (boxes[b].end - boxes[b].begin < 2) {
                continue;
            }
            auto [channel, range] = widest_channel(colors, boxes[b]);
            if (range > best_range) {
                best = b;
                best_range = range;
                best_channel = channel;
            }
        }
        if (best == boxes.size()) {
            break;  // every box holds a single color
        }

        auto& box = boxes[best];
        const auto first = colors.begin() + static_cast<std::ptrdiff_t>(box.begin);
        const auto last = colors.begin() + static_cast<std::ptrdiff_t>(box.end);
        std::sort(first, last, [best_channel](const color_count& a, const color_count& b) {
            return a.rgb[best_channel] < b.rgb[best_channel];
        });

        std::uint64_t total = 0;
        for (auto it = first; it != last; ++it) {
            total += it->count;
        }

        // Pixel-weighted median, keeping both halves non-empty
        std::uint64_t running = 0;
        std::size_t split = box.begin + 1;
        for (std::size_t i = box.begin; i + 1 < box.end; ++i) {
            running += colors[i].count;
            split = i + 1;
            if (running * 2 >= total) {
                break;
            }
        }

        const color_box upper = {split, box.end};
        box.end = split;
        boxes.push_back(upper);
    }

    return boxes;
}

palette_entry box_average(const std::vector<color_count>& colors, const color_box& box) {
    std::uint64_t sum[3] = {0, 0, 0};
    std::uint64_t total = 0;
    for (std::size_t i = box.begin; i < box.end; ++i) {
        for (int c = 0; c < 3; ++c) {
            sum[c] += static_cast<std::uint64_t>(colors[i].rgb[c]) * colors[i].count;
        }
        total += colors[i].count;
    }
    if (total == 0) {
        return {};
    }
    return {static_cast<std::uint8_t>((sum[0] + total / 2) / total),
            static_cast<std::uint8_t>((sum[1] + total / 2) / total),
            static_cast<std::uint8_t>((sum[2] + total / 2) / total)};
}

decode_result copy_surface(const memory_surface& image, surface& surf) {
    if (!surf.set_size(image.width(), image.height(), image.format())) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }
    if (image.format() == pixel_format::indexed8) {
        surf.set_palette_size(static_cast<int>(image.palette().size() / 3));
        surf.write_palette(0, image.palette());
    }
    const std::size_t row_bytes = static_cast<std::size_t>(image.width()) * bytes_per_pixel(image.format());
    for (int y = 0; y < image.height(); ++y) {
        surf.write_pixels(0, y, static_cast<int>(row_bytes),
                          image.pixels().data() + static_cast<std::size_t>(y) * image.pitch());
    }
    return decode_result::success();
}

} // namespace

// ============================================================================
// Indexed Assembly
// ============================================================================

decode_result assemble(const index_grid& grid,
                       const palette& pal,
                       surface& surf,
                       const decode_options& options) {
    auto result = check_inputs(grid, pal);
    if (!result) return result;

    // Resolve all indices before touching the surface
    std::vector<std::uint8_t> indices(grid.cells().begin(), grid.cells().end());
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            auto& index = indices[static_cast<std::size_t>(y) * static_cast<std::size_t>(grid.width()) +
                                  static_cast<std::size_t>(x)];
            if (!resolve_index(index, pal.size(), options.index_policy, index)) {
                return index_error(x, y, index, pal.size());
            }
        }
    }

    if (!surf.set_size(grid.width(), grid.height(), pixel_format::indexed8)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    surf.set_palette_size(static_cast<int>(pal.size()));
    surf.write_palette(0, palette_to_rgb(pal));
    write_rows(surf, indices.data(), static_cast<std::size_t>(grid.width()), grid.height());

    return decode_result::success();
}

// ============================================================================
// Flattening
// ============================================================================

decode_result flatten(const index_grid& grid,
                      const palette& pal,
                      surface& surf,
                      const decode_options& options) {
    auto result = check_inputs(grid, pal);
    if (!result) return result;

    const std::size_t row_bytes = static_cast<std::size_t>(grid.width()) * 3;
    std::vector<std::uint8_t> rgb(row_bytes * static_cast<std::size_t>(grid.height()));

    auto* dst = rgb.data();
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            std::uint8_t index = 0;
            if (!resolve_index(grid.at(x, y), pal.size(), options.index_policy, index)) {
                return index_error(x, y, grid.at(x, y), pal.size());
            }
            const auto& entry = pal[index];
            *dst++ = entry.r;
            *dst++ = entry.g;
            *dst++ = entry.b;
        }
    }

    if (!surf.set_size(grid.width(), grid.height(), pixel_format::rgb888)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }
    write_rows(surf, rgb.data(), row_bytes, grid.height());

    return decode_result::success();
}

decode_result flatten(const memory_surface& image,
                      surface& surf,
                      const decode_options& options) {
    if (image.width() <= 0 || image.height() <= 0) {
        return decode_result::failure(decode_error::invalid_format, "Empty image");
    }
    if (image.format() == pixel_format::rgb888) {
        return copy_surface(image, surf);
    }

    const auto rgb = image.palette();
    palette pal(rgb.size() / 3);
    for (std::size_t i = 0; i < pal.size(); ++i) {
        pal[i] = {rgb[i * 3], rgb[i * 3 + 1], rgb[i * 3 + 2]};
    }

    std::vector<std::uint8_t> cells;
    cells.reserve(static_cast<std::size_t>(image.width()) * static_cast<std::size_t>(image.height()));
    for (int y = 0; y < image.height(); ++y) {
        const auto* row = image.pixels().data() + static_cast<std::size_t>(y) * image.pitch();
        cells.insert(cells.end(), row, row + image.width());
    }

    return flatten(index_grid(image.width(), image.height(), std::move(cells)), pal, surf, options);
}

// ============================================================================
// Adaptive Quantization
// ============================================================================

decode_result quantize_adaptive(const memory_surface& image, surface& surf, int max_colors) {
    if (image.width() <= 0 || image.height() <= 0) {
        return decode_result::failure(decode_error::invalid_format, "Empty image");
    }
    if (max_colors < 1 || max_colors > static_cast<int>(MAX_PALETTE_ENTRIES)) {
        return decode_result::failure(decode_error::out_of_range,
            "Palette size must be 1 to 256, got " + std::to_string(max_colors));
    }
    if (image.format() == pixel_format::indexed8) {
        return copy_surface(image, surf);
    }

    // Distinct colors in first-use order
    std::unordered_map<std::uint32_t, std::size_t> slot_of;
    std::vector<color_count> colors;
    for (int y = 0; y < image.height(); ++y) {
        const auto* row = image.pixels().data() + static_cast<std::size_t>(y) * image.pitch();
        for (int x = 0; x < image.width(); ++x) {
            const auto* p = row + static_cast<std::size_t>(x) * 3;
            auto [it, inserted] = slot_of.try_emplace(pack_rgb(p), colors.size());
            if (inserted) {
                colors.push_back({{p[0], p[1], p[2]}, 0});
            }
            ++colors[it->second].count;
        }
    }

    palette pal;
    std::unordered_map<std::uint32_t, std::uint8_t> index_of;

    if (colors.size() <= static_cast<std::size_t>(max_colors)) {
        for (std::size_t i = 0; i < colors.size(); ++i) {
            pal.push_back({colors[i].rgb[0], colors[i].rgb[1], colors[i].rgb[2]});
            index_of[pack_rgb(colors[i].rgb.data())] = static_cast<std::uint8_t>(i);
        }
    } else {
        const auto boxes = median_cut(colors, static_cast<std::size_t>(max_colors));
        for (std::size_t b = 0; b < boxes.size(); ++b) {
            pal.push_back(box_average(colors, boxes[b]));
            for (std::size_t i = boxes[b].begin; i < boxes[b].end; ++i) {
                index_of[pack_rgb(colors[i].rgb.data())] = static_cast<std::uint8_t>(b);
            }
        }
    }

    std::vector<std::uint8_t> cells;
    cells.reserve(static_cast<std::size_t>(image.width()) * static_cast<std::size_t>(image.height()));
    for (int y = 0; y < image.height(); ++y) {
        const auto* row = image.pixels().data() + static_cast<std::size_t>(y) * image.pitch();
        for (int x = 0; x < image.width(); ++x) {
            cells.push_back(index_of[pack_rgb(row + static_cast<std::size_t>(x) * 3)]);
        }
    }

    return assemble(index_grid(image.width(), image.height(), std::move(cells)), pal, surf);
}

} // namespace ps2tex
