#include <diagram_builder/assembler.hpp>
#include <diagram_builder/relationship_inferencer.hpp>
#include <diagram_builder/type_model_builder.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace diagram_builder {

namespace {

constexpr const char* k_default_title = "UML Diagram";

} // namespace

void EntityCollector::add_source(const diagram_model::SourceFile& source) {
    for (const auto& type : source.types) {
        if (!add_type(type))
            spdlog::debug("Skipping '{}' in {}: no resolved symbol", type.name, source.path);
    }
    for (const auto& en : source.enums)
        add_enum(en);
}

bool EntityCollector::add_type(const diagram_model::TypeDescription& type) {
    if (!type.has_symbol) {
        ++skipped_;
        return false;
    }
    diagram_model::DiagramEntity entity = build_entity(type);
    if (entity.kind != diagram_model::EntityKind::Enum)
        entity.relationships = infer_relationships(type, entity.name, nested_inheritance_);
    entities_.push_back(std::move(entity));
    return true;
}

void EntityCollector::add_enum(const diagram_model::EnumDescription& en) {
    entities_.push_back(build_enum_entity(en));
}

std::vector<diagram_model::DiagramEntity> EntityCollector::take_entities() {
    std::vector<diagram_model::DiagramEntity> out;
    out.swap(entities_);
    return out;
}

std::vector<diagram_model::DiagramEntity> collect_entities(const diagram_model::TypeSnapshot& snapshot,
    bool nested_inheritance)
{
    EntityCollector collector(nested_inheritance);
    for (const auto& source : snapshot.sources)
        collector.add_source(source);
    if (collector.skipped_count() > 0)
        spdlog::debug("{} declared type(s) skipped without a symbol", collector.skipped_count());
    return collector.take_entities();
}

bool is_excluded(const diagram_model::DiagramEntity& entity, const GeneratorOptions& options) {
    switch (entity.kind) {
    case diagram_model::EntityKind::Class: return options.exclude_classes;
    case diagram_model::EntityKind::Interface: return options.exclude_interfaces;
    case diagram_model::EntityKind::Enum: return options.exclude_enums;
    }
    return false;
}

diagram_model::ClassDiagram assemble(std::vector<diagram_model::DiagramEntity> entities,
    const GeneratorOptions& options)
{
    diagram_model::ClassDiagram out;
    entities.erase(std::remove_if(entities.begin(), entities.end(),
        [&](const diagram_model::DiagramEntity& e) { return is_excluded(e, options); }),
        entities.end());
    out.title = entities.empty() ? k_default_title : entities.front().name;
    out.entities = std::move(entities);
    return out;
}

diagram_model::ClassDiagram build_class_diagram(const diagram_model::TypeSnapshot& snapshot,
    const GeneratorOptions& options)
{
    return assemble(collect_entities(snapshot, options.nested_inheritance), options);
}

} // namespace diagram_builder
