#include <ps2tex/source.hpp>
#include <ps2tex/sources/marker_scan.hpp>
#include <ps2tex/sources/studio_model.hpp>

#include <memory>

namespace ps2tex {

// ============================================================================
// Source Wrappers
// ============================================================================

namespace {

class studio_model_source_impl : public texture_source {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return studio_model_source::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return studio_model_source::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data,
                             const decode_options& options) const noexcept override {
        (void)options;
        return studio_model_source::sniff(data);
    }

    [[nodiscard]] decode_result read_header(std::span<const std::uint8_t> data,
                                            parsed_header& header) const override {
        return studio_model_source::read_header(data, header);
    }

    [[nodiscard]] decode_result scan(std::span<const std::uint8_t> data,
                                     std::vector<texture_record>& records,
                                     const decode_options& options) const override {
        (void)options;
        return studio_model_source::scan(data, records);
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                       const texture_record& record,
                                       surface& surf,
                                       const decode_options& options) const override {
        return studio_model_source::decode(data, record, surf, options);
    }

    [[nodiscard]] export_format default_export() const noexcept override {
        return export_format::png8;
    }

    [[nodiscard]] std::string export_stem(const texture_record& record,
                                          std::size_t index) const override {
        return studio_model_source::export_stem(record, index);
    }
};

class marker_scan_source_impl : public texture_source {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return marker_scan_source::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return marker_scan_source::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data,
                             const decode_options& options) const noexcept override {
        return marker_scan_source::sniff(data, options);
    }

    [[nodiscard]] decode_result read_header(std::span<const std::uint8_t> data,
                                            parsed_header& header) const override {
        (void)data;
        header.clear();
        return decode_result::success();
    }

    [[nodiscard]] decode_result scan(std::span<const std::uint8_t> data,
                                     std::vector<texture_record>& records,
                                     const decode_options& options) const override {
        return marker_scan_source::scan(data, records, options);
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                       const texture_record& record,
                                       surface& surf,
                                       const decode_options& options) const override {
        return marker_scan_source::decode(data, record, surf, options);
    }

    [[nodiscard]] export_format default_export() const noexcept override {
        return export_format::bmp;
    }

    [[nodiscard]] std::string export_stem(const texture_record& record,
                                          std::size_t index) const override {
        return marker_scan_source::export_stem(record, index);
    }
};

} // namespace

// ============================================================================
// Source Registry Implementation
// ============================================================================

source_registry& source_registry::instance() {
    static source_registry registry;
    return registry;
}

source_registry::source_registry() {
    register_builtin_sources();
}

source_registry::~source_registry() = default;

void source_registry::register_builtin_sources() {
    sources_.push_back(std::make_unique<studio_model_source_impl>());
    sources_.push_back(std::make_unique<marker_scan_source_impl>());
}

void source_registry::register_source(std::unique_ptr<texture_source> src) {
    if (src) {
        sources_.push_back(std::move(src));
    }
}

const texture_source* source_registry::find_source(std::span<const std::uint8_t> data,
                                                   const decode_options& options) const {
    for (const auto& src : sources_) {
        if (src->sniff(data, options)) {
            return src.get();
        }
    }
    return nullptr;
}

const texture_source* source_registry::find_source(std::string_view name) const {
    for (const auto& src : sources_) {
        if (src->name() == name) {
            return src.get();
        }
    }
    return nullptr;
}

} // namespace ps2tex
