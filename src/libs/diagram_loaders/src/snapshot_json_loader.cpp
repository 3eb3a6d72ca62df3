#include <diagram_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace diagram_loaders {

namespace {

std::string get_string(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : "";
}

bool get_bool(const nlohmann::json& j, const char* key, bool fallback = false) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

diagram_model::TypeKind type_kind_from_string(const std::string& s) {
    if (s == "class" || s == "record") return diagram_model::TypeKind::Class;
    if (s == "interface") return diagram_model::TypeKind::Interface;
    if (s == "enum") return diagram_model::TypeKind::Enum;
    if (s == "struct") return diagram_model::TypeKind::Struct;
    if (s == "array") return diagram_model::TypeKind::Array;
    if (s == "type_parameter") return diagram_model::TypeKind::TypeParameter;
    return diagram_model::TypeKind::Unknown;
}

diagram_model::Accessibility accessibility_from_string(const std::string& s) {
    if (s == "public") return diagram_model::Accessibility::Public;
    if (s == "private") return diagram_model::Accessibility::Private;
    if (s == "protected") return diagram_model::Accessibility::Protected;
    if (s == "internal") return diagram_model::Accessibility::Internal;
    if (s == "protected_internal" || s == "protected_or_internal")
        return diagram_model::Accessibility::ProtectedOrInternal;
    if (s == "private_protected" || s == "protected_and_internal")
        return diagram_model::Accessibility::ProtectedAndInternal;
    return diagram_model::Accessibility::NotApplicable;
}

diagram_model::MethodKind method_kind_from_string(const std::string& s) {
    if (s.empty() || s == "ordinary") return diagram_model::MethodKind::Ordinary;
    if (s == "constructor") return diagram_model::MethodKind::Constructor;
    if (s == "accessor") return diagram_model::MethodKind::Accessor;
    if (s == "operator") return diagram_model::MethodKind::Operator;
    return diagram_model::MethodKind::Other;
}

// A bare string is shorthand for a type with only a name.
diagram_model::TypeRef parse_type_ref(const nlohmann::json& t) {
    diagram_model::TypeRef ref;
    if (t.is_string()) {
        ref.name = t.get<std::string>();
        return ref;
    }
    if (!t.is_object()) return ref;

    ref.name = get_string(t, "name");
    ref.ns = get_string(t, "namespace");
    ref.kind = type_kind_from_string(get_string(t, "kind"));
    if (t.contains("type_arguments") && t["type_arguments"].is_array()) {
        for (const auto& arg : t["type_arguments"])
            ref.type_arguments.push_back(parse_type_ref(arg));
    }
    if (t.contains("element_type") && !t["element_type"].is_null()) {
        ref.element_type.push_back(parse_type_ref(t["element_type"]));
        ref.kind = diagram_model::TypeKind::Array;
    }
    if (t.contains("interfaces") && t["interfaces"].is_array()) {
        for (const auto& iface : t["interfaces"])
            if (iface.is_string()) ref.interfaces.push_back(iface.get<std::string>());
    }
    return ref;
}

std::vector<diagram_model::TypeRef> parse_type_refs(const nlohmann::json& j, const char* key) {
    std::vector<diagram_model::TypeRef> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& t : j[key])
            out.push_back(parse_type_ref(t));
    }
    return out;
}

diagram_model::PropertyDescription parse_property(const nlohmann::json& p) {
    diagram_model::PropertyDescription prop;
    prop.name = get_string(p, "name");
    if (p.contains("type")) prop.type = parse_type_ref(p["type"]);
    prop.accessibility = accessibility_from_string(get_string(p, "accessibility"));
    prop.is_collection_shape = get_bool(p, "is_collection");
    prop.is_implicit = get_bool(p, "is_implicit");
    return prop;
}

diagram_model::MethodDescription parse_method(const nlohmann::json& m) {
    diagram_model::MethodDescription method;
    method.name = get_string(m, "name");
    if (m.contains("return_type")) method.return_type = parse_type_ref(m["return_type"]);
    method.accessibility = accessibility_from_string(get_string(m, "accessibility"));
    method.is_async = get_bool(m, "is_async");
    method.method_kind = method_kind_from_string(get_string(m, "method_kind"));
    method.is_implicit = get_bool(m, "is_implicit");
    if (m.contains("parameters") && m["parameters"].is_array()) {
        for (const auto& p : m["parameters"]) {
            diagram_model::ParameterDescription param;
            param.name = get_string(p, "name");
            if (p.contains("type")) param.type = parse_type_ref(p["type"]);
            method.parameters.push_back(std::move(param));
        }
    }
    return method;
}

std::optional<diagram_model::TypeDescription> parse_type(const nlohmann::json& t) {
    if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) return std::nullopt;

    diagram_model::TypeDescription type;
    type.name = t["name"].get<std::string>();
    const std::string kind = get_string(t, "kind");
    type.kind = kind.empty() ? diagram_model::TypeKind::Class : type_kind_from_string(kind);
    type.is_abstract = get_bool(t, "is_abstract");
    type.accessibility = accessibility_from_string(get_string(t, "accessibility"));
    type.ns = get_string(t, "namespace");
    type.has_symbol = get_bool(t, "has_symbol", true);
    if (t.contains("base") && !t["base"].is_null())
        type.direct_base.push_back(parse_type_ref(t["base"]));
    type.ancestors = parse_type_refs(t, "ancestors");
    type.interfaces = parse_type_refs(t, "interfaces");

    if (t.contains("properties") && t["properties"].is_array()) {
        for (const auto& p : t["properties"])
            type.properties.push_back(parse_property(p));
    }
    if (t.contains("methods") && t["methods"].is_array()) {
        for (const auto& m : t["methods"])
            type.methods.push_back(parse_method(m));
    }
    return type;
}

std::optional<diagram_model::TypeSnapshot> parse_snapshot_json(const nlohmann::json& j) {
    diagram_model::TypeSnapshot out;
    if (!j.is_object() || !j.contains("sources") || !j["sources"].is_array()) return std::nullopt;

    for (const auto& s : j["sources"]) {
        diagram_model::SourceFile source;
        source.path = get_string(s, "path");
        if (s.contains("types") && s["types"].is_array()) {
            for (const auto& t : s["types"]) {
                auto type = parse_type(t);
                if (!type) {
                    spdlog::warn("Type entry without a name in source '{}'", source.path);
                    return std::nullopt;
                }
                source.types.push_back(std::move(*type));
            }
        }
        if (s.contains("enums") && s["enums"].is_array()) {
            for (const auto& e : s["enums"]) {
                diagram_model::EnumDescription en;
                en.name = get_string(e, "name");
                if (e.contains("members") && e["members"].is_array()) {
                    for (const auto& m : e["members"])
                        if (m.is_string()) en.members.push_back(m.get<std::string>());
                }
                source.enums.push_back(std::move(en));
            }
        }
        out.sources.push_back(std::move(source));
    }

    out.project = get_string(j, "project");
    return out;
}

} // namespace

std::optional<diagram_model::TypeSnapshot> load_snapshot_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_snapshot_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid snapshot JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<diagram_model::TypeSnapshot> load_snapshot_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::error("Cannot open snapshot file '{}'", path);
        return std::nullopt;
    }
    return load_snapshot_from_json(f);
}

} // namespace diagram_loaders
