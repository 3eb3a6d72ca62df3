#pragma once

#include <diagram_model/class_diagram.hpp>
#include <diagram_model/types.hpp>
#include <optional>
#include <string>

namespace diagram_builder {

// True for IEnumerable/ICollection/List and anything implementing them, and for arrays.
// Strings never count even though they enumerate characters.
bool is_collection(const diagram_model::TypeRef& type);

// Property type text: "Elem[]" for arrays, "Outer<A, B>" for generics, else the simple name.
std::string type_display_name(const diagram_model::TypeRef& type);

// Method return/parameter type text: simple name, "Elem[]" for arrays.
std::string simple_type_name(const diagram_model::TypeRef& type);

// Empty or blank namespaces become nullopt.
std::optional<std::string> normalize_namespace(const std::string& ns);

// Interface and Enum map to themselves; every other declared kind renders as a class.
diagram_model::EntityKind entity_kind(diagram_model::TypeKind kind);

// Entity for a declared type with its members and no relationships.
// A type declared as an enum gets its properties as enum members and no methods.
diagram_model::DiagramEntity build_entity(const diagram_model::TypeDescription& type);

// Entity for an enum: each member becomes a public property of type "enum".
diagram_model::DiagramEntity build_enum_entity(const diagram_model::EnumDescription& en);

} // namespace diagram_builder
