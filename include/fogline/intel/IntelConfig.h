#pragma once

#include "fogline/core/CVar.h"
#include "fogline/intel/WorldState.h"

namespace fogline::intel {

// Bridges the console-variable registry and WorldStateParams.
//
// installIntelCVars() defines every tunable with the engine defaults (idempotent,
// pending config-file assignments are applied on definition).
// worldParamsFromCVars() reads them back into a parameter set; pair it with
// validateWorldParams() before constructing a WorldState.
void installIntelCVars(core::CVarRegistry& registry);

WorldStateParams worldParamsFromCVars(const core::CVarRegistry& registry);

} // namespace fogline::intel
