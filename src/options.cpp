#include "sourcer/options.h"

namespace sourcer {

Options g_options;

} // namespace sourcer
