// Mermaid class diagram generator: type snapshot JSON in, Markdown file out (C++20)
#include <diagram_builder/options.hpp>
#include <diagram_loaders/json_loader.hpp>
#include <diagram_loaders/sample_snapshot.hpp>
#include <diagram_render/generator.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

namespace {

constexpr const char* k_usage =
    "Usage: mermaid_uml <snapshot.json | --sample> [--outputDir <OutputDirectory>] [--disableClasses] "
    "[--disableInterfaces] [--disableEnums] [--enableNestedInheritance] [--enableNamespaces] [--verbose]";

struct CommandLine {
    std::string input_path;
    bool use_sample = false;
    std::optional<std::string> output_dir;
    bool verbose = false;
    diagram_builder::GeneratorOptions options;
};

// Unknown switches are ignored.
CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    const std::string first = argv[1];
    if (first == "--sample")
        cl.use_sample = true;
    else
        cl.input_path = first;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--outputDir") {
            if (i + 1 < argc) cl.output_dir = argv[++i];
        } else if (arg == "--disableClasses") {
            cl.options.exclude_classes = true;
        } else if (arg == "--disableInterfaces") {
            cl.options.exclude_interfaces = true;
        } else if (arg == "--disableEnums") {
            cl.options.exclude_enums = true;
        } else if (arg == "--enableNestedInheritance") {
            cl.options.nested_inheritance = true;
        } else if (arg == "--enableNamespaces") {
            cl.options.group_by_namespace = true;
        } else if (arg == "--verbose") {
            cl.verbose = true;
        } else if (arg == "--sample") {
            cl.use_sample = true;
        }
    }
    return cl;
}

std::string project_name(const diagram_model::TypeSnapshot& snapshot, const CommandLine& cl) {
    if (!snapshot.project.empty()) return snapshot.project;
    if (cl.use_sample) return "Sample";
    return std::filesystem::path(cl.input_path).stem().string();
}

} // namespace

int main(int argc, char* argv[])
{
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    if (argc < 2) {
        (void)fprintf(stderr, "%s\n", k_usage);
        return 1;
    }

    const CommandLine cl = parse_command_line(argc, argv);
    spdlog::set_level(cl.verbose ? spdlog::level::debug : spdlog::level::info);

    std::optional<diagram_model::TypeSnapshot> snapshot;
    if (cl.use_sample)
        snapshot = diagram_loaders::generate_sample_snapshot();
    else
        snapshot = diagram_loaders::load_snapshot_from_json_file(cl.input_path);
    if (!snapshot) {
        spdlog::error("Could not load a valid type snapshot from '{}'.", cl.input_path);
        return 1;
    }

    const std::string project = project_name(*snapshot, cl);
    std::error_code ec;
    const std::filesystem::path output_dir = cl.output_dir
        ? std::filesystem::path(*cl.output_dir)
        : std::filesystem::current_path(ec);
    if (ec) {
        spdlog::error("Cannot determine the current directory: {}", ec.message());
        return 1;
    }
    const std::filesystem::path output_path = output_dir / diagram_render::output_file_name(project, cl.options);

    spdlog::info("Generating Mermaid UML for project: {}", project);
    const std::string document = diagram_render::generate_mermaid_document(*snapshot, cl.options);
    if (!diagram_render::write_text_file(output_path.string(), document)) {
        spdlog::error("Failed to write '{}'", output_path.string());
        return 1;
    }
    spdlog::info("UML diagram saved to: {}", output_path.string());
    return 0;
}
