#pragma once

#include <diagram_model/types.hpp>
#include <optional>
#include <istream>
#include <string>

namespace diagram_loaders {

// Parses a type snapshot document. Returns nullopt on malformed JSON, a missing
// "sources" array, or a type entry without a name.
std::optional<diagram_model::TypeSnapshot> load_snapshot_from_json(std::istream& in);
std::optional<diagram_model::TypeSnapshot> load_snapshot_from_json_file(const std::string& path);

} // namespace diagram_loaders
