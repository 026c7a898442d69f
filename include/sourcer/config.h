#ifndef SOURCER_CONFIG_H
#define SOURCER_CONFIG_H

#include "sourcer/options.h"
#include "sourcer/resolver.h"

namespace sourcer {

// Fills the search path from `SOURCE_PATH` (or the defaults under `HOME`),
// then the `-I` templates, and appends the `$PATH` searcher when requested.
[[nodiscard]] bool configure(Resolver& resolver, const Options& options);

} // namespace sourcer

#endif
