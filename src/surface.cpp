#include <ps2tex/surface.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

namespace ps2tex {

bool memory_surface::set_size(int width, int height, pixel_format format) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    const std::size_t bpp = bytes_per_pixel(format);

    if (w > std::numeric_limits<std::size_t>::max() / bpp) {
        return false;
    }
    const std::size_t pitch = w * bpp;

    if (pitch > std::numeric_limits<std::size_t>::max() / h) {
        return false;
    }
    const std::size_t total_size = pitch * h;

    // 16384 x 16384 RGB is the largest texture decode_options allows
    constexpr std::size_t MAX_BUFFER_SIZE = 1024ULL * 1024ULL * 1024ULL;
    if (total_size > MAX_BUFFER_SIZE) {
        return false;
    }

    try {
        pixels_.assign(total_size, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = pitch;
    palette_.clear();

    return true;
}

void memory_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (y < 0 || y >= height_ || x < 0 || count <= 0 || !pixels) {
        return;
    }

    const std::size_t x_offset = static_cast<std::size_t>(x);
    if (x_offset >= pitch_) {
        return;
    }

    const std::size_t offset = static_cast<std::size_t>(y) * pitch_ + x_offset;
    const std::size_t bytes_to_copy = std::min(static_cast<std::size_t>(count), pitch_ - x_offset);

    if (offset + bytes_to_copy <= pixels_.size()) {
        std::memcpy(pixels_.data() + offset, pixels, bytes_to_copy);
    }
}

void memory_surface::set_palette_size(int count) {
    if (count <= 0 || count > 256) {
        return;
    }
    palette_.assign(static_cast<std::size_t>(count) * 3, 0);
}

void memory_surface::write_palette(int start, std::span<const std::uint8_t> colors) {
    if (start < 0 || colors.empty()) {
        return;
    }

    const std::size_t start_offset = static_cast<std::size_t>(start) * 3;
    if (start_offset >= palette_.size()) {
        return;
    }

    const std::size_t bytes_to_copy = std::min(colors.size(), palette_.size() - start_offset);
    std::memcpy(palette_.data() + start_offset, colors.data(), bytes_to_copy);
}

const std::uint8_t* memory_surface::pixel_at(int x, int y) const noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return nullptr;
    }
    return pixels_.data() + static_cast<std::size_t>(y) * pitch_ +
           static_cast<std::size_t>(x) * bytes_per_pixel(format_);
}

} // namespace ps2tex
