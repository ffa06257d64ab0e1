#include "debug.hpp"

namespace hrstream {

bool g_debug = false;

} // namespace hrstream
