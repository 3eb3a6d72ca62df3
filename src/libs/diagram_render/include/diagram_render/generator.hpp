#pragma once

#include <diagram_builder/options.hpp>
#include <diagram_model/types.hpp>
#include <string>

namespace diagram_render {

// Snapshot in, Mermaid document out: collect, filter, render.
std::string generate_mermaid_document(const diagram_model::TypeSnapshot& snapshot,
    const diagram_builder::GeneratorOptions& options);

// "{project}[_NoClasses][_NoInterfaces][_NoEnums][_NestedInheritance][_WithNamespaces].md"
std::string output_file_name(const std::string& project, const diagram_builder::GeneratorOptions& options);

// Overwrites `path`. Returns false if the file could not be written.
bool write_text_file(const std::string& path, const std::string& text);

} // namespace diagram_render
