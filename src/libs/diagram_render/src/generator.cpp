#include <diagram_render/generator.hpp>
#include <diagram_render/renderer.hpp>
#include <diagram_builder/assembler.hpp>
#include <fstream>

namespace diagram_render {

std::string generate_mermaid_document(const diagram_model::TypeSnapshot& snapshot,
    const diagram_builder::GeneratorOptions& options)
{
    const diagram_model::ClassDiagram diagram = diagram_builder::build_class_diagram(snapshot, options);
    return render_mermaid(diagram,
        options.group_by_namespace ? RenderLayout::GroupedByNamespace : RenderLayout::Flat);
}

std::string output_file_name(const std::string& project, const diagram_builder::GeneratorOptions& options) {
    std::string name = project;
    if (options.exclude_classes) name += "_NoClasses";
    if (options.exclude_interfaces) name += "_NoInterfaces";
    if (options.exclude_enums) name += "_NoEnums";
    if (options.nested_inheritance) name += "_NestedInheritance";
    if (options.group_by_namespace) name += "_WithNamespaces";
    return name + ".md";
}

bool write_text_file(const std::string& path, const std::string& text) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << text;
    f.flush();
    return static_cast<bool>(f);
}

} // namespace diagram_render
