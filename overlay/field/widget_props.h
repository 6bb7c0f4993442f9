#pragma once

#include "overlay/field/field_value.h"
#include <string_view>

// Styling hooks never reach the reactive layer: widgets expose only the
// behavioural subset of their component props.
bool isOptionAllowed(FieldKind kind, std::string_view key);

// Returns a copy of `options` with every disallowed key removed.
FieldOptions sanitizeOptions(FieldKind kind, const FieldOptions& options);
