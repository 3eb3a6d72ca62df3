#pragma once

#include <diagram_model/class_diagram.hpp>
#include <diagram_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace diagram_builder {

// Append-only edge list that drops repeated (from, to, kind) triples.
// freeze() hands the collected edges over; the builder is empty afterwards.
class RelationshipSetBuilder {
public:
    // Returns false when an identical edge is already present.
    bool add(diagram_model::Relationship relationship);
    bool contains(const diagram_model::Relationship& relationship) const;
    std::size_t size() const { return edges_.size(); }
    std::vector<diagram_model::Relationship> freeze();

private:
    std::vector<diagram_model::Relationship> edges_;
};

// The universal base every class derives from.
bool is_root_object(const diagram_model::TypeRef& type);

// Library types whose namespace starts with "System" produce no member edges.
bool is_system_type(const diagram_model::TypeRef& type);

// Array element, else the single type argument of a one-argument generic, else the type itself.
const diagram_model::TypeRef& resolve_member_target(const diagram_model::TypeRef& type);

// Edge implied by one property of `owner`, or nullopt when the target is a system type
// or has no name.
std::optional<diagram_model::Relationship> classify_member(const std::string& owner,
    const diagram_model::PropertyDescription& property);

// Inheritance, realization and member-derived edges of one type, deduplicated, in that order.
std::vector<diagram_model::Relationship> infer_relationships(
    const diagram_model::TypeDescription& type,
    const std::string& entity_name,
    bool nested_inheritance);

} // namespace diagram_builder
