#include <diagram_builder/type_model_builder.hpp>
#include <diagram_model/mapping.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace diagram_builder {

namespace {

constexpr std::array<std::string_view, 3> k_collection_names = { "IEnumerable", "ICollection", "List" };

bool is_collection_name(std::string_view name) {
    return std::find(k_collection_names.begin(), k_collection_names.end(), name) != k_collection_names.end();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

diagram_model::Member build_member(const diagram_model::PropertyDescription& p) {
    diagram_model::Member m;
    m.name = p.name;
    m.type = type_display_name(p.type);
    m.visibility = diagram_model::map_visibility(p.accessibility);
    m.is_collection = p.is_collection_shape || is_collection(p.type);
    return m;
}

diagram_model::MethodSig build_method(const diagram_model::MethodDescription& md) {
    diagram_model::MethodSig m;
    m.name = md.name;
    m.return_type = simple_type_name(md.return_type);
    m.visibility = diagram_model::map_visibility(md.accessibility);
    m.is_async = md.is_async;
    m.parameters.reserve(md.parameters.size());
    for (const auto& param : md.parameters)
        m.parameters.push_back(simple_type_name(param.type) + " " + param.name);
    return m;
}

} // namespace

diagram_model::EntityKind entity_kind(diagram_model::TypeKind kind) {
    switch (kind) {
    case diagram_model::TypeKind::Interface: return diagram_model::EntityKind::Interface;
    case diagram_model::TypeKind::Enum: return diagram_model::EntityKind::Enum;
    case diagram_model::TypeKind::Unknown:
    case diagram_model::TypeKind::Class:
    case diagram_model::TypeKind::Struct:
    case diagram_model::TypeKind::Array:
    case diagram_model::TypeKind::TypeParameter:
        return diagram_model::EntityKind::Class;
    }
    return diagram_model::EntityKind::Class;
}

bool is_collection(const diagram_model::TypeRef& type) {
    if (to_lower(type.name) == "string")
        return false;
    if (type.is_array())
        return true;
    if (is_collection_name(type.name))
        return true;
    return std::any_of(type.interfaces.begin(), type.interfaces.end(),
        [](const std::string& iface) { return is_collection_name(iface); });
}

std::string type_display_name(const diagram_model::TypeRef& type) {
    if (type.is_array())
        return type.element().name + "[]";
    if (type.type_arguments.empty())
        return type.name;

    std::string out = type.name + "<";
    for (std::size_t i = 0; i < type.type_arguments.size(); ++i) {
        if (i > 0) out += ", ";
        out += type.type_arguments[i].name;
    }
    out += ">";
    return out;
}

std::string simple_type_name(const diagram_model::TypeRef& type) {
    if (type.is_array())
        return type.element().name + "[]";
    return type.name;
}

std::optional<std::string> normalize_namespace(const std::string& ns) {
    const bool blank = std::all_of(ns.begin(), ns.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) return std::nullopt;
    return ns;
}

diagram_model::DiagramEntity build_entity(const diagram_model::TypeDescription& type) {
    diagram_model::DiagramEntity e;
    e.name = type.name;
    e.kind = entity_kind(type.kind);
    e.is_abstract = type.is_abstract;
    e.visibility = diagram_model::map_visibility(type.accessibility);
    e.ns = normalize_namespace(type.ns);

    // Enums declared as types keep their member names and nothing else.
    if (e.kind == diagram_model::EntityKind::Enum) {
        e.is_abstract = false;
        for (const auto& p : type.properties) {
            if (p.is_implicit) continue;
            e.properties.push_back(diagram_model::Member{ p.name, "enum", diagram_model::Visibility::Public, false });
        }
        return e;
    }

    for (const auto& p : type.properties) {
        if (p.is_implicit) continue;
        e.properties.push_back(build_member(p));
    }
    for (const auto& m : type.methods) {
        if (m.is_implicit || m.method_kind != diagram_model::MethodKind::Ordinary) continue;
        e.methods.push_back(build_method(m));
    }
    return e;
}

diagram_model::DiagramEntity build_enum_entity(const diagram_model::EnumDescription& en) {
    diagram_model::DiagramEntity e;
    e.name = en.name;
    e.kind = diagram_model::EntityKind::Enum;
    e.visibility = diagram_model::Visibility::Public;
    e.properties.reserve(en.members.size());
    for (const auto& member : en.members)
        e.properties.push_back(diagram_model::Member{ member, "enum", diagram_model::Visibility::Public, false });
    return e;
}

} // namespace diagram_builder
