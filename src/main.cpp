/// @file src/main.cpp
/// @brief dwalk CLI entry point.
///
/// Usage:
///   dwalk --list [category]                 List catalog sources
///   dwalk --generate-math <out_dir>         Write an artifact per math source
///   dwalk --convert <source_id> <raw_file>  Convert a raw payload to an artifact
///   dwalk --walk <artifact.json>            Print the walk as x,y,z rows
///   dwalk --help                            Print usage
///
/// Options:
///   --config <sources.yaml>   Manifest (built-in math catalog otherwise)
///   --mapping <name>          Mapping override for --walk
///   --max-points <n>          Subsampling bound (default 10000)
///   --digits <n>              Digits requested from math sources (default 5000)
///   --base4                   Base-4 conversion and lattice walk

#include "dwalk/artifact.hpp"
#include "dwalk/data_loader.hpp"
#include "dwalk/engine.hpp"
#include "dwalk/source_catalog.hpp"
#include "dwalk/walk.hpp"

#include <fmt/core.h>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  dwalk --list [category]                 List catalog sources\n"
        "  dwalk --generate-math <out_dir>         Write an artifact per math source\n"
        "  dwalk --convert <source_id> <raw_file>  Convert a raw payload to an artifact\n"
        "  dwalk --walk <artifact.json>            Print the walk as x,y,z rows\n"
        "  dwalk --help                            Show this help\n"
        "\n"
        "Options:\n"
        "  --config <sources.yaml>   Manifest (built-in math catalog otherwise)\n"
        "  --mapping <name>          Mapping override for --walk\n"
        "  --max-points <n>          Subsampling bound (default {})\n"
        "  --digits <n>              Digits requested from math sources (default {})\n"
        "  --base4                   Base-4 conversion and lattice walk\n",
        dwalk::constants::DEFAULT_MAX_POINTS,
        dwalk::constants::DEFAULT_MATH_DIGITS
    );
}

struct Options {
    std::string                 mode;
    std::vector<std::string>    positional;
    std::optional<std::string>  config_path;
    std::optional<std::string>  mapping;
    dwalk::core::EngineConfig   engine;
};

std::optional<std::size_t> parse_count(const std::string& text) {
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Parse argv. Returns nullopt (after printing why) on a malformed command line.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    opts.mode = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", flag);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            opts.config_path = value("--config");
            if (!opts.config_path) return std::nullopt;
        } else if (arg == "--mapping") {
            opts.mapping = value("--mapping");
            if (!opts.mapping) return std::nullopt;
        } else if (arg == "--max-points" || arg == "--digits") {
            const auto text = value(arg.c_str());
            if (!text) return std::nullopt;
            const auto n = parse_count(*text);
            if (!n) {
                fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n", arg, *text);
                return std::nullopt;
            }
            (arg == "--max-points" ? opts.engine.max_points : opts.engine.math_digits) = *n;
        } else if (arg == "--base4") {
            opts.engine.radix = dwalk::Radix::Base4;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return opts;
}

dwalk::core::SourceCatalog load_catalog(const Options& opts) {
    if (!opts.config_path) {
        return dwalk::core::SourceCatalog::defaults();
    }
    auto catalog = dwalk::core::SourceCatalog::load(*opts.config_path);
    for (const auto& w : catalog.warnings()) {
        fmt::print(stderr, "[dwalk] warning: {}\n", w);
    }
    return catalog;
}

int run_list(const Options& opts) {
    const auto catalog = load_catalog(opts);
    const auto sources = opts.positional.empty()
        ? catalog.sources()
        : catalog.by_category(opts.positional.front());

    for (const auto& s : sources) {
        fmt::print("{:<28} {:<10} {:<14} {}\n", s.id, s.category, s.subcategory, s.converter);
    }
    fmt::print("{} sources\n", sources.size());
    return 0;
}

int run_generate_math(const Options& opts) {
    if (opts.positional.empty()) {
        fmt::print(stderr, "Error: --generate-math requires an output directory\n");
        return 1;
    }
    const std::filesystem::path out_dir(opts.positional.front());
    std::filesystem::create_directories(out_dir);

    const auto catalog = load_catalog(opts);
    const dwalk::core::Engine engine(opts.engine);

    std::size_t written = 0;
    for (const auto& source : catalog.sources()) {
        if (!source.converter.starts_with("math.")) continue;
        if (!dwalk::core::Engine::is_known_converter(source.converter)) {
            fmt::print(stderr, "[dwalk] {}: unknown converter '{}', skipped\n",
                       source.id, source.converter);
            continue;
        }

        const dwalk::core::WalkArtifact artifact{
            .id          = source.id,
            .name        = source.name,
            .category    = source.category,
            .subcategory = source.subcategory,
            .digits      = engine.convert(source, {}),
        };

        const auto path = out_dir / (source.id + ".json");
        std::ofstream file(path);
        if (!file.is_open()) {
            fmt::print(stderr, "Error: cannot write '{}'\n", path.string());
            return 1;
        }
        file << dwalk::core::ArtifactCodec::to_json(artifact) << '\n';
        fmt::print("{:<28} {:>7} digits -> {}\n", source.id, artifact.digits.size(), path.string());
        ++written;
    }

    fmt::print("Wrote {} artifacts.\n", written);
    return 0;
}

int run_convert(const Options& opts) {
    if (opts.positional.size() < 2) {
        fmt::print(stderr, "Error: --convert requires <source_id> <raw_file>\n");
        return 1;
    }
    const auto catalog = load_catalog(opts);
    const auto source = catalog.find(opts.positional[0]);
    if (!source) {
        fmt::print(stderr, "Error: unknown source '{}'\n", opts.positional[0]);
        return 1;
    }
    if (!dwalk::core::Engine::is_known_converter(source->converter)) {
        fmt::print(stderr, "[dwalk] {}: unknown converter '{}', emitting [0]\n",
                   source->id, source->converter);
    }
    if (opts.mapping) {
        // Artifacts hold digits only; the mapping is chosen at walk time.
        fmt::print(stderr, "[dwalk] warning: --mapping applies to --walk only; ignored\n");
    }

    const auto payload = dwalk::core::DataLoader::load_file(opts.positional[1]);
    if (!payload) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.positional[1]);
        return 1;
    }

    const dwalk::core::Engine engine(opts.engine);
    const dwalk::core::WalkArtifact artifact{
        .id          = source->id,
        .name        = source->name,
        .category    = source->category,
        .subcategory = source->subcategory,
        .digits      = engine.convert(*source, *payload),
    };
    fmt::print("{}\n", dwalk::core::ArtifactCodec::to_json(artifact));
    return 0;
}

int run_walk(const Options& opts) {
    if (opts.positional.empty()) {
        fmt::print(stderr, "Error: --walk requires an artifact path\n");
        return 1;
    }
    const auto text = dwalk::core::DataLoader::load_file(opts.positional.front());
    if (!text) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.positional.front());
        return 1;
    }

    const auto artifact = dwalk::core::ArtifactCodec::parse(*text);
    const auto catalog  = load_catalog(opts);

    std::string mapping_name = opts.mapping.value_or(std::string(dwalk::mapping::MappingPresets::IDENTITY));
    if (!opts.mapping) {
        if (const auto source = catalog.find(artifact.id)) {
            mapping_name = source->mapping;
        }
    }

    const dwalk::core::Engine engine(opts.engine);
    const auto points = engine.walk(artifact.digits, catalog.resolve_mapping(mapping_name));

    fmt::print(stderr, "[dwalk] {}: {} digits, {} points, mapping {}\n",
               artifact.id, artifact.digits.size(), points.size(), mapping_name);
    for (const auto& p : points) {
        fmt::print("{},{},{}\n", p.x(), p.y(), p.z());
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    try {
        if (mode == "--list")          return run_list(*opts);
        if (mode == "--generate-math") return run_generate_math(*opts);
        if (mode == "--convert")       return run_convert(*opts);
        if (mode == "--walk")          return run_walk(*opts);
    } catch (const dwalk::ConversionFailed& e) {
        fmt::print(stderr, "[dwalk] {}\n", e.what());
        return 2;
    } catch (const std::exception& e) {
        fmt::print(stderr, "[FATAL] {}\n", e.what());
        return 1;
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
