#include <ps2tex/byte_scanner.hpp>
#include <ps2tex/header_parser.hpp>
#include <ps2tex/palette.hpp>

#include <algorithm>

namespace ps2tex {

namespace {

// A name ends where three consecutive zero bytes begin
constexpr std::size_t NAME_TERMINATOR_LENGTH = 3;

constexpr std::string_view EMBEDDED_FILENAME_SUFFIX = ".BMP";

} // namespace

std::optional<std::size_t> find_next(std::span<const std::uint8_t> buffer,
                                     std::span<const std::uint8_t> pattern,
                                     std::size_t from) noexcept {
    if (pattern.empty() || from >= buffer.size() || buffer.size() - from < pattern.size()) {
        return std::nullopt;
    }

    const auto it = std::search(buffer.begin() + static_cast<std::ptrdiff_t>(from), buffer.end(),
                                pattern.begin(), pattern.end());
    if (it == buffer.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - buffer.begin());
}

std::string sanitize_name(std::span<const std::uint8_t> raw) {
    std::string name;
    name.reserve(raw.size());
    for (const auto byte : raw) {
        if (byte >= 0x80) {
            continue;
        }
        name.push_back(byte == 0 ? '_' : static_cast<char>(byte));
    }
    return name;
}

extracted_name extract_name(std::span<const std::uint8_t> buffer,
                            std::size_t marker_offset,
                            std::size_t marker_size) {
    extracted_name result;
    if (marker_offset >= buffer.size()) {
        result.end = buffer.size();
        return result;
    }

    std::size_t end = std::min(marker_offset + marker_size, buffer.size());

    // The three-byte probe never reads past the buffer; without a terminator
    // the name stops three bytes short of the end.
    while (end + NAME_TERMINATOR_LENGTH < buffer.size() &&
           !(buffer[end] == 0 && buffer[end + 1] == 0 && buffer[end + 2] == 0)) {
        ++end;
    }

    result.text = sanitize_name(buffer.subspan(marker_offset, end - marker_offset));
    result.end = end;
    return result;
}

bool is_embedded_filename(std::string_view name) noexcept {
    return name.size() >= EMBEDDED_FILENAME_SUFFIX.size() &&
           name.substr(name.size() - EMBEDDED_FILENAME_SUFFIX.size()) == EMBEDDED_FILENAME_SUFFIX;
}

decode_result scan_records(std::span<const std::uint8_t> buffer,
                           const decode_options& options,
                           std::vector<texture_record>& records) {
    const auto marker = as_bytes(options.name_marker);
    const std::span<const std::uint8_t> sentinel(options.data_sentinel);

    if (marker.empty() || sentinel.empty()) {
        return decode_result::failure(decode_error::invalid_format,
            "Name marker and data sentinel must not be empty");
    }

    std::size_t start = 0;
    while (start < buffer.size()) {
        const auto name_start = find_next(buffer, marker, start);
        if (!name_start) {
            break;
        }

        auto name = extract_name(buffer, *name_start, marker.size());
        if (is_embedded_filename(name.text)) {
            start = name.end;
            continue;
        }

        const auto sentinel_at = find_next(buffer, sentinel, name.end);
        if (!sentinel_at) {
            break;
        }

        texture_record record;
        record.name = std::move(name.text);
        record.name_offset = *name_start;
        record.data_offset = *sentinel_at;
        record.end_offset = find_next(buffer, marker, *sentinel_at + sentinel.size())
                                .value_or(buffer.size());
        record.palette_offset = *sentinel_at;
        record.pixel_offset = *sentinel_at + PS2_PALETTE_BYTES;

        // Without a size pattern the record keeps 0x0 and fails when decoded
        std::uint16_t width = 0;
        std::uint16_t height = 0;
        if (read_size_pattern(buffer, *sentinel_at, width, height)) {
            record.width = width;
            record.height = height;
        }

        start = record.end_offset;
        records.push_back(std::move(record));
    }

    return decode_result::success();
}

} // namespace ps2tex
