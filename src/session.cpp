#include <ps2tex/session.hpp>
#include <ps2tex/codecs/bmp.hpp>
#include <ps2tex/codecs/png.hpp>
#include <ps2tex/file_io.hpp>
#include <ps2tex/image_assembler.hpp>

#include <algorithm>
#include <set>
#include <system_error>

namespace ps2tex {

namespace {

const char* extension_for(export_format format) noexcept {
    switch (format) {
        case export_format::bmp:  return ".bmp";
        case export_format::png8: return ".png";
    }
    return "";
}

} // namespace

// ============================================================================
// Export Report
// ============================================================================

std::size_t export_report::saved_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const record_outcome& o) { return o.result.ok; }));
}

std::size_t export_report::failed_count() const noexcept {
    return outcomes.size() - saved_count();
}

// ============================================================================
// Loading
// ============================================================================

void session::reset() noexcept {
    data_.clear();
    source_ = nullptr;
    header_.clear();
    records_.clear();
}

decode_result session::load(const std::filesystem::path& path,
                            const decode_options& options,
                            std::string_view source_name) {
    reset();

    std::vector<std::uint8_t> data;
    auto result = read_file(path, data, options.max_file_size);
    if (!result) return result;

    return load(std::move(data), options, source_name);
}

decode_result session::load(std::vector<std::uint8_t> data,
                            const decode_options& options,
                            std::string_view source_name) {
    reset();

    if (data.size() > options.max_file_size) {
        return decode_result::failure(decode_error::io_error,
            "Input of " + std::to_string(data.size()) + " bytes exceeds limit of " +
            std::to_string(options.max_file_size));
    }

    const auto& registry = source_registry::instance();
    const texture_source* src = source_name.empty()
        ? registry.find_source(data, options)
        : registry.find_source(source_name);

    if (!src) {
        return decode_result::failure(decode_error::invalid_format,
            source_name.empty() ? std::string("No texture source recognizes this data")
                                : "Unknown source: " + std::string(source_name));
    }

    parsed_header header;
    auto result = src->read_header(data, header);
    if (!result) return result;

    std::vector<texture_record> records;
    result = src->scan(data, records, options);
    if (!result) return result;

    if (records.empty()) {
        return decode_result::failure(decode_error::pattern_not_found,
            "No textures found by source '" + std::string(src->name()) + "'");
    }

    data_ = std::move(data);
    options_ = options;
    source_ = src;
    header_ = std::move(header);
    records_ = std::move(records);
    return decode_result::success();
}

// ============================================================================
// Decoding
// ============================================================================

decode_result session::get_image(std::size_t index, surface& surf) const {
    if (!source_) {
        return decode_result::failure(decode_error::invalid_format, "No file loaded");
    }
    if (index >= records_.size()) {
        return decode_result::failure(decode_error::out_of_range,
            "Texture " + std::to_string(index) + " requested, " +
            std::to_string(records_.size()) + " available");
    }
    return source_->decode(data_, records_[index], surf, options_);
}

decode_result session::get_flattened(std::size_t index, surface& surf) const {
    memory_surface indexed;
    auto result = get_image(index, indexed);
    if (!result) return result;

    return flatten(indexed, surf, options_);
}

// ============================================================================
// Export
// ============================================================================

std::string session::export_name(std::size_t index, export_format format) const {
    if (!source_ || index >= records_.size()) {
        return {};
    }
    return source_->export_stem(records_[index], index) + extension_for(format);
}

record_outcome session::save_one(std::size_t index,
                                 const std::filesystem::path& path,
                                 export_format format) const {
    record_outcome outcome;
    outcome.index = index;
    if (index < records_.size()) {
        outcome.name = records_[index].name;
        outcome.offset = records_[index].data_offset;
    }

    memory_surface image;
    outcome.result = get_image(index, image);
    if (!outcome.result) {
        return outcome;
    }

    switch (format) {
        case export_format::bmp:
            outcome.result = save_bmp(image, path);
            break;
        case export_format::png8: {
            // Same route as the viewer: flatten, then re-quantize to 8 bits
            memory_surface rgb;
            outcome.result = flatten(image, rgb, options_);
            if (!outcome.result) {
                return outcome;
            }
            outcome.result = save_png8(rgb, path);
            break;
        }
    }

    if (!outcome.result) {
        return outcome;
    }

    outcome.path = path;
    return outcome;
}

export_report session::save_all(const std::filesystem::path& directory,
                                export_format format) const {
    export_report report;

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);

    std::set<std::string> used_names;

    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (ec) {
            record_outcome outcome;
            outcome.index = i;
            outcome.name = records_[i].name;
            outcome.offset = records_[i].data_offset;
            outcome.result = decode_result::failure(decode_error::io_error,
                "Cannot create " + directory.string() + ": " + ec.message());
            report.outcomes.push_back(std::move(outcome));
            continue;
        }

        // Records sharing a name keep their own file, including when the
        // suffixed name is itself taken by another record
        const std::string stem = source_->export_stem(records_[i], i);
        std::string file_name = stem + extension_for(format);
        for (std::size_t attempt = 0; !used_names.insert(file_name).second; ++attempt) {
            file_name = stem + "_" + std::to_string(i) +
                        (attempt == 0 ? std::string() : "_" + std::to_string(attempt)) +
                        extension_for(format);
        }
        report.outcomes.push_back(save_one(i, directory / file_name, format));
    }

    return report;
}

export_report session::save_all(const std::filesystem::path& directory) const {
    if (!source_) {
        return {};
    }
    return save_all(directory, source_->default_export());
}

} // namespace ps2tex
