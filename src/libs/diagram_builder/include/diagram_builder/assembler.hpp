#pragma once

#include <diagram_builder/options.hpp>
#include <diagram_model/class_diagram.hpp>
#include <diagram_model/types.hpp>
#include <cstddef>
#include <vector>

namespace diagram_builder {

// Accumulates entities across source files in first-seen order.
// Per file: classes and interfaces first, then enums.
class EntityCollector {
public:
    explicit EntityCollector(bool nested_inheritance) : nested_inheritance_(nested_inheritance) {}

    void add_source(const diagram_model::SourceFile& source);
    // Returns false when the type has no resolved symbol and was skipped.
    bool add_type(const diagram_model::TypeDescription& type);
    void add_enum(const diagram_model::EnumDescription& en);

    const std::vector<diagram_model::DiagramEntity>& entities() const { return entities_; }
    std::size_t skipped_count() const { return skipped_; }
    std::vector<diagram_model::DiagramEntity> take_entities();

private:
    bool nested_inheritance_;
    std::size_t skipped_ = 0;
    std::vector<diagram_model::DiagramEntity> entities_;
};

std::vector<diagram_model::DiagramEntity> collect_entities(const diagram_model::TypeSnapshot& snapshot,
    bool nested_inheritance);

bool is_excluded(const diagram_model::DiagramEntity& entity, const GeneratorOptions& options);

// Drops excluded kinds, keeps order, and titles the diagram after the first survivor.
diagram_model::ClassDiagram assemble(std::vector<diagram_model::DiagramEntity> entities,
    const GeneratorOptions& options);

diagram_model::ClassDiagram build_class_diagram(const diagram_model::TypeSnapshot& snapshot,
    const GeneratorOptions& options);

} // namespace diagram_builder
