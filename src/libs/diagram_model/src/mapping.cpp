#include <diagram_model/mapping.hpp>

namespace diagram_model {

Visibility map_visibility(Accessibility accessibility) {
    switch (accessibility) {
    case Accessibility::Public: return Visibility::Public;
    case Accessibility::Private: return Visibility::Private;
    case Accessibility::Protected: return Visibility::Protected;
    case Accessibility::Internal: return Visibility::Internal;
    case Accessibility::ProtectedOrInternal: return Visibility::ProtectedOrInternal;
    case Accessibility::ProtectedAndInternal:
    case Accessibility::NotApplicable:
        return Visibility::Unknown;
    }
    return Visibility::Unknown;
}

std::string_view visibility_token(Visibility visibility) {
    switch (visibility) {
    case Visibility::Public: return "+";
    case Visibility::Private: return "-";
    case Visibility::Protected: return "#";
    case Visibility::Internal: return "~";
    case Visibility::ProtectedOrInternal: return "~";
    case Visibility::Unknown: return "?";
    }
    return "?";
}

std::string_view relationship_token(RelationshipKind kind) {
    switch (kind) {
    case RelationshipKind::Inheritance: return "|>";
    case RelationshipKind::Composition: return "*";
    case RelationshipKind::Aggregation: return "o";
    case RelationshipKind::Association: return ">";
    case RelationshipKind::Realization: return "|>";
    case RelationshipKind::Dependency: return ">";
    case RelationshipKind::Link: return "";
    }
    return "?";
}

std::string_view relationship_context(RelationshipKind kind) {
    switch (kind) {
    case RelationshipKind::Inheritance: return "inherits";
    case RelationshipKind::Composition: return "composes";
    case RelationshipKind::Aggregation: return "aggregates";
    case RelationshipKind::Association: return "associates";
    case RelationshipKind::Realization: return "realizes";
    case RelationshipKind::Dependency: return "depends on";
    case RelationshipKind::Link: return "links";
    }
    return "unknown";
}

std::string_view link_token(LinkStyle /*style*/, RelationshipKind kind) {
    // The arrow body follows the relationship kind; the stored style is informational.
    switch (kind) {
    case RelationshipKind::Realization:
    case RelationshipKind::Dependency:
    case RelationshipKind::Link:
        return "..";
    case RelationshipKind::Inheritance:
    case RelationshipKind::Composition:
    case RelationshipKind::Aggregation:
    case RelationshipKind::Association:
        return "--";
    }
    return "--";
}

std::string_view entity_kind_name(EntityKind kind) {
    switch (kind) {
    case EntityKind::Interface: return "Interface";
    case EntityKind::Class: return "Class";
    case EntityKind::Enum: return "Enum";
    }
    return "Class";
}

} // namespace diagram_model
