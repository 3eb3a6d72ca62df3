#pragma once

#include <optional>
#include <string>
#include <vector>

namespace diagram_model {

enum class Visibility { Public, Private, Protected, Internal, ProtectedOrInternal, Unknown };

enum class EntityKind { Interface, Class, Enum };

enum class RelationshipKind { Inheritance, Composition, Aggregation, Association, Dependency, Realization, Link };

enum class LinkStyle { Solid, Dashed };

struct Member {
    std::string name;
    // Display form: generics as Outer<Arg>, arrays as Elem[].
    std::string type;
    Visibility visibility = Visibility::Public;
    bool is_collection = false;
};

struct MethodSig {
    std::string name;
    std::string return_type;
    Visibility visibility = Visibility::Public;
    // Each entry is "Type name".
    std::vector<std::string> parameters;
    bool is_async = false;
};

struct Relationship {
    std::string from;
    std::string to;
    RelationshipKind kind = RelationshipKind::Association;
    LinkStyle link_style = LinkStyle::Solid;
};

inline bool same_edge(const Relationship& a, const Relationship& b) {
    return a.from == b.from && a.to == b.to && a.kind == b.kind;
}

struct DiagramEntity {
    // Simple name. Entities are identified by it within one diagram.
    std::string name;
    EntityKind kind = EntityKind::Class;
    bool is_abstract = false;
    Visibility visibility = Visibility::Public;
    std::optional<std::string> ns;
    std::vector<Member> properties;
    std::vector<MethodSig> methods;
    // Edges whose inference started at this entity; no duplicate (from, to, kind).
    std::vector<Relationship> relationships;
};

struct ClassDiagram {
    std::string title;
    std::vector<DiagramEntity> entities;
};

} // namespace diagram_model
