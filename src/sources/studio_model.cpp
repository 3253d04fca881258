#include <ps2tex/sources/studio_model.hpp>
#include "texture_decode.hpp"

#include <algorithm>
#include <cctype>
#include <new>

namespace ps2tex {

namespace {

constexpr std::string_view EXPORT_STRIP_SUFFIX = ".bmp";

} // namespace

bool studio_model_source::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < STUDIO_HEADER_SIZE) {
        return false;
    }

    try {
        parsed_header header;
        if (!parse_fixed_header(data, studio_header_layout(), 0, header)) {
            return false;
        }

        const auto count = header.u32("numtextures").value_or(0);
        const auto table = header.u32("textureindex").value_or(0);
        const auto blob = header.u32("texturedataindex").value_or(0);

        if (count == 0 || table < STUDIO_HEADER_SIZE || blob < STUDIO_HEADER_SIZE) {
            return false;
        }

        std::vector<texture_record> records;
        return static_cast<bool>(parse_texture_table(data, header, records));
    } catch (const std::bad_alloc&) {
        return false;
    }
}

decode_result studio_model_source::read_header(std::span<const std::uint8_t> data,
                                               parsed_header& header) {
    return parse_fixed_header(data, studio_header_layout(), 0, header);
}

decode_result studio_model_source::scan(std::span<const std::uint8_t> data,
                                        std::vector<texture_record>& records) {
    parsed_header header;
    auto result = read_header(data, header);
    if (!result) return result;

    return parse_texture_table(data, header, records);
}

decode_result studio_model_source::decode(std::span<const std::uint8_t> data,
                                          const texture_record& record,
                                          surface& surf,
                                          const decode_options& options) {
    return decode_texture(data, record, options.ps2_palette_swizzle, surf, options);
}

std::string studio_model_source::export_stem(const texture_record& record, std::size_t index) {
    std::string stem = record.name;
    std::transform(stem.begin(), stem.end(), stem.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (stem.size() >= EXPORT_STRIP_SUFFIX.size() &&
        stem.compare(stem.size() - EXPORT_STRIP_SUFFIX.size(), EXPORT_STRIP_SUFFIX.size(),
                     EXPORT_STRIP_SUFFIX) == 0) {
        stem.erase(stem.size() - EXPORT_STRIP_SUFFIX.size());
    }

    if (stem.empty()) {
        return "texture_" + std::to_string(index);
    }
    return file_safe(std::move(stem));
}

} // namespace ps2tex
