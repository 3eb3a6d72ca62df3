#pragma once

#include <diagram_model/types.hpp>

namespace diagram_loaders {

// Small zoo domain spread over three source files, covering every edge kind.
diagram_model::TypeSnapshot generate_sample_snapshot();

} // namespace diagram_loaders
