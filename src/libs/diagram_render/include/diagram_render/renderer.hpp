#pragma once

#include <diagram_model/class_diagram.hpp>
#include <string>

namespace diagram_render {

enum class RenderLayout {
    // Each entity: body, stereotype, then its edges.
    Flat,
    // All bodies inside namespace blocks, then every stereotype, then every edge.
    GroupedByNamespace
};

// Full Mermaid document: fenced block, front matter, classDiagram body.
std::string render_mermaid(const diagram_model::ClassDiagram& diagram, RenderLayout layout);

std::string format_member(const diagram_model::Member& member);
std::string format_method(const diagram_model::MethodSig& method);
// "From --|> To : inherits", without indentation.
std::string format_relationship(const diagram_model::Relationship& relationship);
// "<<abstract>> Name" for abstract classes, "<<Kind>> Name" otherwise.
std::string format_stereotype(const diagram_model::DiagramEntity& entity);

// Mermaid namespace identifier: dots replaced by dashes.
std::string namespace_key(const std::string& ns);

} // namespace diagram_render
