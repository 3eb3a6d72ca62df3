#pragma once

#include <string>
#include <vector>

namespace diagram_model {

// Snapshot of declared types as delivered by the analysis front end.

enum class Accessibility {
    NotApplicable,
    Private,
    ProtectedAndInternal,
    Protected,
    Internal,
    ProtectedOrInternal,
    Public
};

enum class TypeKind { Unknown, Class, Interface, Enum, Struct, Array, TypeParameter };

struct TypeRef {
    std::string name;
    std::string ns;
    TypeKind kind = TypeKind::Unknown;
    std::vector<TypeRef> type_arguments;
    // Exactly one entry when kind == Array.
    std::vector<TypeRef> element_type;
    // Simple names of every interface the type implements, transitively.
    std::vector<std::string> interfaces;

    bool is_array() const { return kind == TypeKind::Array && !element_type.empty(); }
    const TypeRef& element() const { return element_type.front(); }
};

struct PropertyDescription {
    std::string name;
    TypeRef type;
    Accessibility accessibility = Accessibility::NotApplicable;
    bool is_collection_shape = false;
    bool is_implicit = false;
};

struct ParameterDescription {
    std::string name;
    TypeRef type;
};

enum class MethodKind { Ordinary, Constructor, Accessor, Operator, Other };

struct MethodDescription {
    std::string name;
    TypeRef return_type;
    Accessibility accessibility = Accessibility::NotApplicable;
    std::vector<ParameterDescription> parameters;
    bool is_async = false;
    MethodKind method_kind = MethodKind::Ordinary;
    bool is_implicit = false;
};

struct TypeDescription {
    std::string name;
    TypeKind kind = TypeKind::Class;
    bool is_abstract = false;
    Accessibility accessibility = Accessibility::NotApplicable;
    std::string ns;
    // False when the declaration was seen but no symbol could be resolved.
    bool has_symbol = true;
    // Empty when the type has no base besides the root object type.
    std::vector<TypeRef> direct_base;
    // Nearest first, may end with the root object type.
    std::vector<TypeRef> ancestors;
    std::vector<TypeRef> interfaces;
    std::vector<PropertyDescription> properties;
    std::vector<MethodDescription> methods;
};

struct EnumDescription {
    std::string name;
    std::vector<std::string> members;
};

struct SourceFile {
    std::string path;
    std::vector<TypeDescription> types;
    std::vector<EnumDescription> enums;
};

struct TypeSnapshot {
    std::string project;
    std::vector<SourceFile> sources;
};

} // namespace diagram_model
