#pragma once

namespace shspec::driver {

// Default logger on stderr. 0 = warn, 1 = info, 2+ = debug.
void ConfigureLogging(int verbosity);

}  // namespace shspec::driver
