#pragma once

namespace diagram_builder {

struct GeneratorOptions {
    bool exclude_classes = false;
    bool exclude_interfaces = false;
    bool exclude_enums = false;
    // Emit an inheritance edge to every ancestor instead of the direct base only.
    bool nested_inheritance = false;
    bool group_by_namespace = false;
};

} // namespace diagram_builder
