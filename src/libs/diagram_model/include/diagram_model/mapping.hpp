#pragma once

#include <diagram_model/class_diagram.hpp>
#include <diagram_model/types.hpp>
#include <string_view>

namespace diagram_model {

// Lookup tables between source-level enums and Mermaid class diagram tokens.
// Every switch names all enumerators so a new one fails -Wswitch until added here.

Visibility map_visibility(Accessibility accessibility);

std::string_view visibility_token(Visibility visibility);

// Arrow head: "|>", "*", "o", ">" or "" for a plain link.
std::string_view relationship_token(RelationshipKind kind);

// Label printed after the colon, e.g. "inherits".
std::string_view relationship_context(RelationshipKind kind);

// Line body: ".." for realization, dependency and link, "--" otherwise.
std::string_view link_token(LinkStyle style, RelationshipKind kind);

// "Class", "Interface" or "Enum" as used in <<stereotype>> lines.
std::string_view entity_kind_name(EntityKind kind);

} // namespace diagram_model
