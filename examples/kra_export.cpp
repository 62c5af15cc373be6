#include <kra_image/kra_image.hpp>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file.kra> [output_dir]\n";
    std::cerr << "Exports every paint layer with content to PNG.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list    List the layer tree only\n";
    std::cerr << "  -h, --help    Show this help\n";
}

void print_layer(const kra_image::document& doc, kra_image::layer_id id, int depth) {
    const auto& l = doc.layer_at(id);
    std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ')
              << l.name << " [" << kra_image::to_string(l.kind) << "]";
    if (!l.bounds.empty()) {
        std::cout << " " << l.width() << "x" << l.height()
                  << " at " << static_cast<long long>(l.bounds.left) + l.x << ","
                  << static_cast<long long>(l.bounds.top) + l.y;
    }
    if (const auto* c = l.clone()) {
        std::cout << " -> " << doc.layer_at(c->target).name;
    }
    if (!l.visible) std::cout << " (hidden)";
    if (!doc.is_useful(id)) std::cout << " (empty)";
    std::cout << "\n";

    for (const auto mask : l.masks) {
        print_layer(doc, mask, depth + 1);
    }
    for (const auto child : doc.children(id)) {
        print_layer(doc, child, depth + 1);
    }
}

// Layer names may contain path separators; keep the file name flat
std::string file_name_for(const kra_image::layer& l, kra_image::layer_id id) {
    std::string name = l.name.empty() ? "layer" : l.name;
    for (auto& c : name) {
        if (c == '/' || c == '\\' || c == ':') c = '_';
    }
    return std::to_string(id) + "_" + name + ".png";
}

int export_layers(const kra_image::document& doc, const std::filesystem::path& output_dir) {
    int exported = 0;
    for (kra_image::layer_id id = 0; id < doc.layer_count(); ++id) {
        const auto& l = doc.layer_at(id);
        if (l.kind != kra_image::layer_kind::paint_layer || !doc.is_useful(id)) {
            continue;
        }

        kra_image::memory_surface surface;
        kra_image::layer_bounds bounds;
        auto result = kra_image::extract_image(l, surface, bounds);
        if (!result) {
            std::cerr << "Warning: " << l.name << ": " << result.message << "\n";
            continue;
        }
        if (surface.width() == 0 || surface.height() == 0) {
            continue;
        }

        const auto output_path = output_dir / file_name_for(l, id);
        if (!kra_image::save_png(surface, output_path)) {
            std::cerr << "Error: Failed to save: " << output_path << "\n";
            return -1;
        }

        std::cout << "Saved: " << output_path << " (" << bounds.left << "," << bounds.top << ")\n";
        ++exported;
    }
    return exported;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    bool list_only = false;
    int arg = 1;
    if (std::strcmp(argv[arg], "-h") == 0 || std::strcmp(argv[arg], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }
    if (std::strcmp(argv[arg], "-l") == 0 || std::strcmp(argv[arg], "--list") == 0) {
        list_only = true;
        ++arg;
    }
    if (arg >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(argv[arg]);
    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    kra_image::document doc;
    auto result = kra_image::document::open(input_path, doc);
    if (!result) {
        std::cerr << "Error: Failed to open: " << kra_image::to_string(result.error)
                  << ": " << result.message << "\n";
        return 1;
    }

    std::cout << doc.name() << ": " << doc.width() << "x" << doc.height()
              << " " << kra_image::to_string(doc.mode()) << "\n";
    for (const auto& warning : doc.warnings()) {
        std::cerr << "Warning: " << warning << "\n";
    }
    for (const auto id : doc.roots()) {
        print_layer(doc, id, 1);
    }

    if (list_only) {
        return 0;
    }

    std::filesystem::path output_dir = arg + 1 < argc ? std::filesystem::path(argv[arg + 1])
                                                      : input_path.parent_path();
    if (output_dir.empty()) {
        output_dir = ".";
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create " << output_dir << ": " << ec.message() << "\n";
        return 1;
    }

    const int exported = export_layers(doc, output_dir);
    if (exported < 0) {
        return 1;
    }

    std::cout << "Exported " << exported << " layer(s)\n";
    return 0;
}
