#include <ps2tex/sources/marker_scan.hpp>
#include <ps2tex/byte_scanner.hpp>
#include "texture_decode.hpp"

namespace ps2tex {

bool marker_scan_source::sniff(std::span<const std::uint8_t> data,
                               const decode_options& options) noexcept {
    const auto marker = find_next(data, as_bytes(options.name_marker), 0);
    if (!marker) {
        return false;
    }
    return find_next(data, options.data_sentinel, *marker + options.name_marker.size()).has_value();
}

decode_result marker_scan_source::scan(std::span<const std::uint8_t> data,
                                       std::vector<texture_record>& records,
                                       const decode_options& options) {
    return scan_records(data, options, records);
}

decode_result marker_scan_source::decode(std::span<const std::uint8_t> data,
                                         const texture_record& record,
                                         surface& surf,
                                         const decode_options& options) {
    // The palette here is stored linearly
    return decode_texture(data, record, false, surf, options);
}

std::string marker_scan_source::export_stem(const texture_record& record, std::size_t index) {
    if (record.name.empty()) {
        return "texture_" + std::to_string(index);
    }
    return file_safe(record.name);
}

} // namespace ps2tex
