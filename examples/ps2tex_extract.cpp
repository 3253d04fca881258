#include <ps2tex/ps2tex.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file>\n";
    std::cerr << "Extracts 8-bit PS2 textures to BMP or PNG files.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list             List available sources\n";
    std::cerr << "  -i, --info             Print header fields and the texture table only\n";
    std::cerr << "  -o, --output <dir>     Output directory (default: current directory)\n";
    std::cerr << "  -t, --texture <n>      Export only texture n\n";
    std::cerr << "  -f, --format <fmt>     bmp or png (default: per source)\n";
    std::cerr << "  -s, --source <name>    Force a source instead of detecting one\n";
    std::cerr << "  -m, --marker <text>    Texture name marker (default: psx_)\n";
    std::cerr << "      --no-swizzle       Keep fixed-header palettes in stored order\n";
    std::cerr << "      --wrap-indices     Wrap out-of-range palette indices\n";
    std::cerr << "  -v, --verbose          Print record offsets\n";
    std::cerr << "  -h, --help             Show this help\n";
}

void list_sources() {
    std::cout << "Available sources:\n";
    const auto& registry = ps2tex::source_registry::instance();
    for (std::size_t i = 0; i < registry.source_count(); ++i) {
        const auto* source = registry.source_at(i);
        std::cout << "  " << source->name() << " (";
        bool first = true;
        for (const auto& ext : source->extensions()) {
            if (!first) std::cout << ", ";
            std::cout << ext;
            first = false;
        }
        std::cout << ")\n";
    }
}

std::string hex(std::size_t value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "0x%zx", value);
    return buf;
}

void print_info(const ps2tex::session& session) {
    if (!session.header().empty()) {
        std::cout << "Header:\n";
        for (const auto& field : session.header().fields()) {
            std::cout << "  " << field.name << " = " << ps2tex::format_value(field.value) << "\n";
        }
    }

    std::cout << "Textures:\n";
    const auto& records = session.textures();
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        std::cout << "  " << i << ": " << r.name << "  " << r.width << "x" << r.height
                  << "  flags=" << r.flags << "  data=" << hex(r.data_offset) << "\n";
    }
}

void print_record_trace(const ps2tex::texture_record& r) {
    std::cerr << "  name at " << hex(r.name_offset)
              << ", data at " << hex(r.data_offset)
              << ", end at " << hex(r.end_offset)
              << ", size " << r.width << "x" << r.height << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    ps2tex::decode_options options;
    std::filesystem::path output_dir = ".";
    std::filesystem::path input_path;
    std::optional<std::size_t> only_texture;
    std::optional<ps2tex::export_format> format;
    std::string source_name;
    bool info_only = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        // nullptr when the flag is the last argument
        auto next_value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " needs a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--list") == 0) {
            list_sources();
            return 0;
        } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(arg, "-i") == 0 || std::strcmp(arg, "--info") == 0) {
            info_only = true;
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0) {
            const char* value = next_value(arg);
            if (!value) return 1;
            output_dir = value;
        } else if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--texture") == 0) {
            char* end = nullptr;
            const char* value = next_value(arg);
            if (!value) return 1;
            const unsigned long long n = std::strtoull(value, &end, 10);
            if (end == value || *end != '\0') {
                std::cerr << "Error: Invalid texture index: " << value << "\n";
                return 1;
            }
            only_texture = static_cast<std::size_t>(n);
        } else if (std::strcmp(arg, "-f") == 0 || std::strcmp(arg, "--format") == 0) {
            const char* value = next_value(arg);
            if (!value) return 1;
            if (std::strcmp(value, "bmp") == 0) {
                format = ps2tex::export_format::bmp;
            } else if (std::strcmp(value, "png") == 0) {
                format = ps2tex::export_format::png8;
            } else {
                std::cerr << "Error: Unknown format: " << value << "\n";
                return 1;
            }
        } else if (std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--source") == 0) {
            const char* value = next_value(arg);
            if (!value) return 1;
            source_name = value;
        } else if (std::strcmp(arg, "-m") == 0 || std::strcmp(arg, "--marker") == 0) {
            const char* value = next_value(arg);
            if (!value) return 1;
            options.name_marker = value;
        } else if (std::strcmp(arg, "--no-swizzle") == 0) {
            options.ps2_palette_swizzle = false;
        } else if (std::strcmp(arg, "--wrap-indices") == 0) {
            options.index_policy = ps2tex::palette_index_policy::wrap;
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        } else {
            input_path = arg;
        }
    }

    if (input_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    ps2tex::session session;
    auto result = session.load(input_path, options, source_name);
    if (!result) {
        std::cerr << "Error: " << input_path.string() << ": " << result.message
                  << " (" << ps2tex::to_string(result.error) << ")\n";
        return 1;
    }

    std::cout << "Detected source: " << session.source()->name() << "\n";
    std::cout << "Found " << session.textures().size() << " textures\n";

    if (verbose) {
        for (const auto& record : session.textures()) {
            std::cerr << record.name << "\n";
            print_record_trace(record);
        }
    }

    if (info_only) {
        print_info(session);
        return 0;
    }

    const auto fmt = format.value_or(session.source()->default_export());

    if (only_texture) {
        if (*only_texture >= session.textures().size()) {
            std::cerr << "Error: Texture " << *only_texture << " out of range (0-"
                      << session.textures().size() - 1 << ")\n";
            return 1;
        }

        std::error_code ec;
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            std::cerr << "Error: Cannot create " << output_dir.string() << ": " << ec.message() << "\n";
            return 1;
        }

        const auto outcome = session.save_one(*only_texture,
            output_dir / session.export_name(*only_texture, fmt), fmt);
        if (!outcome.result) {
            std::cerr << "Error: " << outcome.result.message << "\n";
            return 1;
        }
        std::cout << "Saved: " << outcome.path.string() << "\n";
        return 0;
    }

    const auto report = session.save_all(output_dir, fmt);
    for (const auto& outcome : report.outcomes) {
        if (outcome.result) {
            std::cout << "Saved: " << outcome.path.string() << "\n";
        } else {
            std::cerr << "Failed: texture " << outcome.index << ": " << outcome.result.message
                      << " (" << ps2tex::to_string(outcome.result.error) << ")\n";
        }
    }

    std::cout << "Saved " << report.saved_count() << " of " << report.outcomes.size() << " textures\n";
    if (report.saved_count() == 0) {
        return 1;
    }
    return report.all_saved() ? 0 : 2;
}
