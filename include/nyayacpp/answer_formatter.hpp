#pragma once

#include "nyayacpp/types.hpp"
#include "nyayacpp/workflow.hpp"

namespace nyayacpp {

// Pure projection of a finished workflow onto the response shape. Missing fields take defaults.
[[nodiscard]] StructuredAnswer FormatAnswer(const WorkflowState& state);

}  // namespace nyayacpp
