#include <diagram_builder/relationship_inferencer.hpp>
#include <diagram_builder/type_model_builder.hpp>
#include <algorithm>
#include <string_view>
#include <utility>

namespace diagram_builder {

namespace {

constexpr std::string_view k_root_object_name = "Object";
constexpr std::string_view k_system_namespace_prefix = "System";

diagram_model::Relationship make_edge(std::string from, std::string to,
    diagram_model::RelationshipKind kind, diagram_model::LinkStyle style)
{
    diagram_model::Relationship r;
    r.from = std::move(from);
    r.to = std::move(to);
    r.kind = kind;
    r.link_style = style;
    return r;
}

// Ancestors when the front end supplied them, else just the direct base.
const std::vector<diagram_model::TypeRef>& ancestor_chain(const diagram_model::TypeDescription& type) {
    return type.ancestors.empty() ? type.direct_base : type.ancestors;
}

void add_inheritance(RelationshipSetBuilder& edges, const diagram_model::TypeDescription& type,
    const std::string& entity_name, bool nested_inheritance)
{
    if (nested_inheritance) {
        for (const auto& ancestor : ancestor_chain(type)) {
            if (is_root_object(ancestor)) continue;
            edges.add(make_edge(entity_name, ancestor.name,
                diagram_model::RelationshipKind::Inheritance, diagram_model::LinkStyle::Solid));
        }
        return;
    }

    const diagram_model::TypeRef* direct = nullptr;
    if (!type.direct_base.empty())
        direct = &type.direct_base.front();
    else if (!type.ancestors.empty())
        direct = &type.ancestors.front();
    if (direct && !is_root_object(*direct))
        edges.add(make_edge(entity_name, direct->name,
            diagram_model::RelationshipKind::Inheritance, diagram_model::LinkStyle::Solid));
}

void add_interfaces(RelationshipSetBuilder& edges, const diagram_model::TypeDescription& type,
    const std::string& entity_name)
{
    // Interface-to-interface is inheritance; class-to-interface is realization.
    const auto kind = type.kind == diagram_model::TypeKind::Interface
        ? diagram_model::RelationshipKind::Inheritance
        : diagram_model::RelationshipKind::Realization;
    for (const auto& iface : type.interfaces)
        edges.add(make_edge(entity_name, iface.name, kind, diagram_model::LinkStyle::Dashed));
}

} // namespace

bool RelationshipSetBuilder::add(diagram_model::Relationship relationship) {
    if (contains(relationship))
        return false;
    edges_.push_back(std::move(relationship));
    return true;
}

bool RelationshipSetBuilder::contains(const diagram_model::Relationship& relationship) const {
    return std::any_of(edges_.begin(), edges_.end(),
        [&](const diagram_model::Relationship& r) { return diagram_model::same_edge(r, relationship); });
}

std::vector<diagram_model::Relationship> RelationshipSetBuilder::freeze() {
    std::vector<diagram_model::Relationship> out;
    out.swap(edges_);
    return out;
}

bool is_root_object(const diagram_model::TypeRef& type) {
    return type.name == k_root_object_name;
}

bool is_system_type(const diagram_model::TypeRef& type) {
    return type.ns.compare(0, k_system_namespace_prefix.size(), k_system_namespace_prefix) == 0;
}

const diagram_model::TypeRef& resolve_member_target(const diagram_model::TypeRef& type) {
    if (type.is_array())
        return type.element();
    if (type.type_arguments.size() == 1)
        return type.type_arguments.front();
    return type;
}

std::optional<diagram_model::Relationship> classify_member(const std::string& owner,
    const diagram_model::PropertyDescription& property)
{
    const diagram_model::TypeRef& target = resolve_member_target(property.type);
    // A nameless target has nothing to point at.
    if (target.name.empty() || is_system_type(target))
        return std::nullopt;

    diagram_model::RelationshipKind kind = diagram_model::RelationshipKind::Association;
    if (target.kind == diagram_model::TypeKind::Enum)
        kind = diagram_model::RelationshipKind::Dependency;
    else if (is_collection(property.type))
        kind = diagram_model::RelationshipKind::Aggregation;

    // Aggregation reads element -> container; everything else owner -> target.
    if (kind == diagram_model::RelationshipKind::Aggregation)
        return make_edge(target.name, owner, kind, diagram_model::LinkStyle::Solid);
    return make_edge(owner, target.name, kind, diagram_model::LinkStyle::Solid);
}

std::vector<diagram_model::Relationship> infer_relationships(
    const diagram_model::TypeDescription& type,
    const std::string& entity_name,
    bool nested_inheritance)
{
    RelationshipSetBuilder edges;
    add_inheritance(edges, type, entity_name, nested_inheritance);
    add_interfaces(edges, type, entity_name);
    for (const auto& property : type.properties) {
        if (auto edge = classify_member(entity_name, property))
            edges.add(std::move(*edge));
    }
    return edges.freeze();
}

} // namespace diagram_builder
