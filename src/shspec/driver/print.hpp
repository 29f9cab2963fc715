#pragma once

#include <string>

#include "shspec/common/diagnostic.hpp"

namespace shspec::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
// Error or warning line depending on kind, followed by its notes.
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace shspec::driver
